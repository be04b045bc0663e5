#include <gtest/gtest.h>
#include "quill/engine/patch_engine.hpp"

using namespace quill;
using namespace quill::engine;

namespace {

std::string block(const std::string& search, const std::string& replace) {
    return "<<<<<<< SEARCH\n" + search + "\n=======\n" + replace + "\n>>>>>>> REPLACE";
}

const std::string kSource =
    "import React from 'react';\n"
    "\n"
    "export function Greeting() {\n"
    "  const name = 'world';\n"
    "  return <h1>Hello {name}</h1>;\n"
    "}\n";

} // namespace

// ============================================================================
// Parsing
// ============================================================================

TEST(PatchEngineParseTest, ParsesMultipleBlocksAndIgnoresProse) {
    auto rules = PatchEngine::parse_rules(
        "Some explanation first.\n" + block("a", "b") + "\nmore prose\n" + block("c\nd", "e"));
    ASSERT_TRUE(rules.has_value());
    ASSERT_EQ(rules->size(), 2u);
    EXPECT_EQ((*rules)[0], (PatchRule{"a", "b"}));
    EXPECT_EQ((*rules)[1], (PatchRule{"c\nd", "e"}));
}

TEST(PatchEngineParseTest, MarkerTrailingWhitespaceAndCarriageReturnsIgnored) {
    auto rules = PatchEngine::parse_rules("<<<<<<< SEARCH  \r\nold\r\n=======\t\r\nnew\r\n>>>>>>> REPLACE \r\n");
    ASSERT_TRUE(rules.has_value());
    ASSERT_EQ(rules->size(), 1u);
    EXPECT_EQ((*rules)[0].search, "old");
    EXPECT_EQ((*rules)[0].replace, "new");
}

TEST(PatchEngineParseTest, EmptyReplaceAllowed) {
    auto rules = PatchEngine::parse_rules("<<<<<<< SEARCH\nremove me\n=======\n>>>>>>> REPLACE");
    ASSERT_TRUE(rules.has_value());
    EXPECT_EQ((*rules)[0].replace, "");
}

TEST(PatchEngineParseTest, MalformedInputs) {
    const std::vector<std::string> inputs = {
        "",                                                        // no blocks
        "just prose",                                              // no blocks
        "<<<<<<< SEARCH\nold\n=======\nnew\n",                     // unterminated
        "<<<<<<< SEARCH\nold\n>>>>>>> REPLACE",                    // missing separator
        ">>>>>>> REPLACE",                                         // replace outside block
        "<<<<<<< SEARCH\n<<<<<<< SEARCH\n=======\n>>>>>>> REPLACE", // nested
        "<<<<<<< SEARCH\n\n=======\nnew\n>>>>>>> REPLACE",         // empty search
        block("same", "same"),                                     // no-op
    };
    for (const auto& input : inputs) {
        auto rules = PatchEngine::parse_rules(input);
        ASSERT_FALSE(rules.has_value()) << input;
        EXPECT_EQ(rules.error().code, ErrorCode::PatchMalformed) << input;
    }
}

// ============================================================================
// Applying
// ============================================================================

TEST(PatchEngineApplyTest, ExactMatchReplaced) {
    auto result = PatchEngine::apply(kSource, block("  const name = 'world';", "  const name = 'quill';"));
    ASSERT_TRUE(result.has_value());
    EXPECT_NE(result->find("const name = 'quill';"), std::string::npos);
    EXPECT_EQ(result->find("'world'"), std::string::npos);
}

TEST(PatchEngineApplyTest, RulesApplyToPreviouslyPatchedContent) {
    const std::string rules = block("const name = 'world';", "const name = 'there';") + "\n" +
                              block("const name = 'there';", "const name = 'again';");
    auto result = PatchEngine::apply(kSource, rules);
    ASSERT_TRUE(result.has_value());
    EXPECT_NE(result->find("'again'"), std::string::npos);
}

TEST(PatchEngineApplyTest, WhitespaceTolerantLineMatch) {
    // Search text indented differently from the file
    auto result = PatchEngine::apply(kSource,
        block("export function Greeting() {\nconst name = 'world';", "export function Greeting() {\n  const name = 'ws';"));
    ASSERT_TRUE(result.has_value());
    EXPECT_NE(result->find("const name = 'ws';"), std::string::npos);
    EXPECT_EQ(result->find("'world'"), std::string::npos);
    EXPECT_NE(result->find("return <h1>"), std::string::npos);
}

TEST(PatchEngineApplyTest, TargetNotFound) {
    auto result = PatchEngine::apply(kSource, block("does not exist", "x"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::PatchTargetNotFound);
    EXPECT_NE(result.error().message.find("block 1 of 1"), std::string::npos);
}

TEST(PatchEngineApplyTest, AmbiguousExactMatch) {
    auto result = PatchEngine::apply("x = 1;\ny = 2;\nx = 1;\n", block("x = 1;", "x = 3;"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::PatchTargetAmbiguous);
}

TEST(PatchEngineApplyTest, AmbiguousWhitespaceMatch) {
    auto result = PatchEngine::apply("  a();\nb();\n    a();\n", block("a();  ", "c();"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::PatchTargetAmbiguous);
}

TEST(PatchEngineApplyTest, ReapplyingIsNotFound) {
    const std::string rules = block("const name = 'world';", "const name = 'quill';");
    auto once = PatchEngine::apply(kSource, rules);
    ASSERT_TRUE(once.has_value());

    auto twice = PatchEngine::apply(*once, rules);
    ASSERT_FALSE(twice.has_value());
    EXPECT_EQ(twice.error().code, ErrorCode::PatchTargetNotFound);
}

TEST(PatchEngineApplyTest, ReapplyingInsertionAfterSearchIsNotFound) {
    const std::string rules = block("import React from 'react';",
                                    "import React from 'react';\nimport { useState } from 'react';");
    auto once = PatchEngine::apply(kSource, rules);
    ASSERT_TRUE(once.has_value());
    EXPECT_NE(once->find("import { useState } from 'react';\n\nexport"), std::string::npos);

    auto twice = PatchEngine::apply(*once, rules);
    ASSERT_FALSE(twice.has_value());
    EXPECT_EQ(twice.error().code, ErrorCode::PatchTargetNotFound);
    EXPECT_NE(twice.error().message.find("already applied"), std::string::npos);
}

TEST(PatchEngineApplyTest, ReapplyingWhitespaceTolerantInsertionIsNotFound) {
    // Unindented search only matches through the line comparison
    const std::string rules = block("export function Greeting() {\nconst name = 'world';",
                                    "export function Greeting() {\n  const name = 'world';\n  const greeting = 'hi';");
    auto once = PatchEngine::apply(kSource, rules);
    ASSERT_TRUE(once.has_value());
    EXPECT_NE(once->find("  const greeting = 'hi';\n  return"), std::string::npos);

    auto twice = PatchEngine::apply(*once, rules);
    ASSERT_FALSE(twice.has_value());
    EXPECT_EQ(twice.error().code, ErrorCode::PatchTargetNotFound);
    EXPECT_NE(twice.error().message.find("already applied"), std::string::npos);
}

TEST(PatchEngineApplyTest, SearchOutsideEarlierReplacementStillApplies) {
    const std::string content = "a();\nb();\n\na();\n";
    auto result = PatchEngine::apply(content, block("a();", "a();\nb();"));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, "a();\nb();\n\na();\nb();\n");
}

TEST(PatchEngineApplyTest, CrlfEndingsPreservedInLineMatch) {
    const std::string content = "one\r\n  two\r\nthree\r\n";
    auto result = PatchEngine::apply(content, block("two\n  three", "TWO\nTHREE\nFOUR"));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, "one\r\nTWO\r\nTHREE\r\nFOUR\r\n");
}

TEST(PatchEngineApplyTest, CrlfEndingsPreservedInExactMatch) {
    const std::string content = "one\r\ntwo\r\nthree\r\n";
    auto result = PatchEngine::apply(content, block("two", "2a\n2b"));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, "one\r\n2a\r\n2b\r\nthree\r\n");
}

TEST(PatchEngineApplyTest, FailureInLaterBlockLeavesNothingApplied) {
    const std::string rules = block("const name = 'world';", "const name = 'quill';") + "\n" +
                              block("missing line", "x");
    auto result = PatchEngine::apply(kSource, rules);
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message.find("block 2 of 2"), std::string::npos);
}
