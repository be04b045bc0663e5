#include <gtest/gtest.h>
#include "quill/services/process_runner.hpp"

using namespace quill;
using namespace quill::services;

TEST(ProcessRunnerTest, CapturesOutputAndExitCode) {
    auto result = run_process({"/bin/sh", "-c", "echo out; echo err >&2; exit 4"});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->exit_code, 4);
    EXPECT_FALSE(result->ok());
    EXPECT_EQ(result->stdout_text, "out\n");
    EXPECT_EQ(result->stderr_text, "err\n");
}

TEST(ProcessRunnerTest, WritesInput) {
    auto result = run_process({"/bin/cat"}, std::string("hello"));
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->ok());
    EXPECT_EQ(result->stdout_text, "hello");
}

TEST(ProcessRunnerTest, EmptyCommandRejected) {
    auto result = run_process({});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ProcessSpawnFailed);
}
