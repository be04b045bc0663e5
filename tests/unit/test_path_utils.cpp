#include <gtest/gtest.h>
#include "quill/parser/path_utils.hpp"

using namespace quill;
using namespace quill::parser;

// ============================================================================
// normalize_path
// ============================================================================

TEST(NormalizePathTest, PlainRelativePathUnchanged) {
    EXPECT_EQ(normalize_path("src/App.tsx"), std::optional<std::string>("src/App.tsx"));
}

TEST(NormalizePathTest, BackslashesBecomeSlashes) {
    EXPECT_EQ(normalize_path("src\\components\\Button.tsx"),
              std::optional<std::string>("src/components/Button.tsx"));
}

TEST(NormalizePathTest, DotSegmentsCollapse) {
    EXPECT_EQ(normalize_path("./src/./lib/../App.tsx"), std::optional<std::string>("src/App.tsx"));
    EXPECT_EQ(normalize_path("src//App.tsx"), std::optional<std::string>("src/App.tsx"));
}

TEST(NormalizePathTest, RejectsAbsoluteAndEscaping) {
    EXPECT_FALSE(normalize_path("/etc/passwd").has_value());
    EXPECT_FALSE(normalize_path("C:\\Windows\\system.ini").has_value());
    EXPECT_FALSE(normalize_path("../outside.ts").has_value());
    EXPECT_FALSE(normalize_path("src/../../outside.ts").has_value());
}

TEST(NormalizePathTest, RejectsEmpty) {
    EXPECT_FALSE(normalize_path("").has_value());
    EXPECT_FALSE(normalize_path("   ").has_value());
    EXPECT_FALSE(normalize_path("./").has_value());
    EXPECT_FALSE(normalize_path("src/..").has_value());
}

// ============================================================================
// safe_join
// ============================================================================

TEST(SafeJoinTest, JoinsInsideRoot) {
    auto joined = safe_join("/projects/app", "src/App.tsx");
    ASSERT_TRUE(joined.has_value());
    EXPECT_EQ(joined->generic_string(), "/projects/app/src/App.tsx");
}

TEST(SafeJoinTest, RefusesEscape) {
    auto joined = safe_join("/projects/app", "../other/secret.txt");
    ASSERT_FALSE(joined.has_value());
    EXPECT_EQ(joined.error().code, ErrorCode::InvalidPath);
}

// ============================================================================
// Deployable units
// ============================================================================

TEST(ServerFunctionTest, DetectsFunctionsDirectory) {
    EXPECT_TRUE(is_server_function("supabase/functions/hello/index.ts", "supabase/functions"));
    EXPECT_TRUE(is_server_function("supabase/functions/hello", "supabase/functions/"));
    EXPECT_FALSE(is_server_function("supabase/functions", "supabase/functions"));
    EXPECT_FALSE(is_server_function("supabase/functionsx/hello/index.ts", "supabase/functions"));
    EXPECT_FALSE(is_server_function("src/functions/hello.ts", "supabase/functions"));
}

TEST(ServerFunctionTest, FunctionNameFromFileUsesParentDirectory) {
    EXPECT_EQ(function_name_from_path("supabase/functions/hello/index.ts"), "hello");
    EXPECT_EQ(function_name_from_path("supabase/functions/send-email/utils.ts"), "send-email");
}

TEST(ServerFunctionTest, FunctionNameFromDirectoryUsesBasename) {
    EXPECT_EQ(function_name_from_path("supabase/functions/hello"), "hello");
}
