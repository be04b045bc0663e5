#include <gtest/gtest.h>
#include "quill/engine/action_orchestrator.hpp"
#include "fixtures/responses.hpp"
#include "mocks/mock_services.hpp"
#include "mocks/temp_dir.hpp"

using namespace quill;
using namespace quill::engine;
using quill::testing::InMemoryMessageStore;
using quill::testing::MockDatabaseBranching;
using quill::testing::MockPackageManager;
using quill::testing::MockRemoteService;
using quill::testing::MockVersionControl;
using quill::testing::TempDir;
namespace responses = quill::testing::responses;

class ActionOrchestratorTest : public ::testing::Test {
protected:
    static constexpr ConversationId kConversation = 1;
    static constexpr MessageId kMessage = 10;

    void SetUp() override {
        store = std::make_shared<InMemoryMessageStore>();
        vcs = std::make_shared<MockVersionControl>();
        packages = std::make_shared<MockPackageManager>();
        remote = std::make_shared<MockRemoteService>();
        branching = std::make_shared<MockDatabaseBranching>();

        project.id = 1;
        project.root_path = dir.path().string();
        store->add_project(kConversation, project);
    }

    std::unique_ptr<ActionOrchestrator> make(Config config = {}) {
        ActionOrchestrator::Services services{store, vcs, packages, remote, branching, nullptr};
        auto orchestrator = ActionOrchestrator::create(std::move(services), std::move(config));
        EXPECT_TRUE(orchestrator.has_value());
        return std::move(*orchestrator);
    }

    void link_database() {
        project.linked_database_project_id = "proj-1";
        store->add_project(kConversation, project);
    }

    Expected<ExecutionResult> run(const std::string& response, Config config = {}) {
        store->add_assistant_message(kMessage, kConversation, response);
        auto orchestrator = make(std::move(config));
        return orchestrator->process(ProcessRequest{response, kConversation, kMessage, std::nullopt});
    }

    const services::MessageRecord& stored() { return store->messages.at(kMessage); }

    TempDir dir{"quill_orchestrator"};
    services::ProjectRecord project;
    std::shared_ptr<InMemoryMessageStore> store;
    std::shared_ptr<MockVersionControl> vcs;
    std::shared_ptr<MockPackageManager> packages;
    std::shared_ptr<MockRemoteService> remote;
    std::shared_ptr<MockDatabaseBranching> branching;
};

// ============================================================================
// Construction
// ============================================================================

TEST_F(ActionOrchestratorTest, CreateRequiresCoreServices) {
    ActionOrchestrator::Services services{store, nullptr, packages, nullptr, nullptr, nullptr};
    auto orchestrator = ActionOrchestrator::create(std::move(services));
    ASSERT_FALSE(orchestrator.has_value());
    EXPECT_EQ(orchestrator.error().code, ErrorCode::InvalidConfig);
}

TEST_F(ActionOrchestratorTest, CreateValidatesConfig) {
    Config config;
    config.product_marker = "";
    ActionOrchestrator::Services services{store, vcs, packages, nullptr, nullptr, nullptr};
    auto orchestrator = ActionOrchestrator::create(std::move(services), config);
    ASSERT_FALSE(orchestrator.has_value());
    EXPECT_EQ(orchestrator.error().code, ErrorCode::InvalidConfig);
}

// ============================================================================
// File Operations
// ============================================================================

TEST_F(ActionOrchestratorTest, DeleteRenameWriteRunInPipelineOrder) {
    dir.write("old.ts", "old content");
    dir.write("b.ts", "b content");

    auto result = run(responses::DELETE_RENAME_WRITE);
    ASSERT_TRUE(result.has_value()) << result.error().to_string();

    EXPECT_EQ(dir.read("old.ts"), "export const x = 1;");
    EXPECT_FALSE(dir.exists("b.ts"));

    EXPECT_TRUE(result->files_changed);
    EXPECT_EQ(result->deleted_paths, std::vector<std::string>{"old.ts"});
    EXPECT_EQ(result->renamed_paths, (std::vector<RenamedPath>{{"b.ts", "old.ts"}}));
    EXPECT_EQ(result->written_paths, std::vector<std::string>{"old.ts"});
    EXPECT_TRUE(result->warnings.empty());
    EXPECT_TRUE(result->errors.empty());

    ASSERT_EQ(vcs->commits.size(), 1u);
    EXPECT_EQ(vcs->commits[0].first, "[quill] deleted 1 file(s), renamed 1 file(s), wrote 1 file(s)");
    EXPECT_EQ(result->commit_id, std::optional<std::string>("commit-1"));

    EXPECT_EQ(stored().approval, std::optional<services::ApprovalState>(services::ApprovalState::Approved));
    EXPECT_EQ(stored().commit_id, std::optional<std::string>("commit-1"));
    EXPECT_EQ(stored().content, responses::DELETE_RENAME_WRITE);
}

TEST_F(ActionOrchestratorTest, EveryKindUsesSummaryInCommitMessage) {
    dir.write("src/a.ts", "const a = 1;\n");
    dir.write("src/old.ts", "gone");
    dir.write("src/x.ts", "moved");

    auto result = run(responses::EVERY_KIND);
    ASSERT_TRUE(result.has_value()) << result.error().to_string();

    EXPECT_EQ(dir.read("src/a.ts"), "const a = 2;\n");
    EXPECT_FALSE(dir.exists("src/old.ts"));
    EXPECT_EQ(dir.read("src/y.ts"), "moved");
    EXPECT_EQ(dir.read("src/new.ts"), "export {};");

    // SQL is skipped without a linked database project
    EXPECT_TRUE(remote->executed_sql.empty());

    ASSERT_EQ(vcs->commits.size(), 1u);
    EXPECT_EQ(vcs->commits[0].first,
              "[quill] Add users table - added zod package(s), deleted 1 file(s), renamed 1 file(s), wrote 2 file(s)");
}

TEST_F(ActionOrchestratorTest, RequestSummaryOverridesTag) {
    dir.write("src/a.ts", "const a = 1;\n");
    store->add_assistant_message(kMessage, kConversation, responses::EVERY_KIND);
    auto orchestrator = make();
    auto result = orchestrator->process(
        ProcessRequest{responses::EVERY_KIND, kConversation, kMessage, std::string("Custom summary")});
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(vcs->commits.size(), 1u);
    EXPECT_EQ(vcs->commits[0].first.rfind("[quill] Custom summary - ", 0), 0u);
}

TEST_F(ActionOrchestratorTest, FencedWriteBodyIsUnwrapped) {
    auto result = run(responses::FENCED_WRITE);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(dir.read("src/App.tsx"), "export function App() {\n\n  return null;\n}");
}

TEST_F(ActionOrchestratorTest, MissingRenameSourceIsSkipped) {
    auto result = run(R"(<rename from="nope.ts" to="dest.ts"></rename>)");
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->files_changed);
    EXPECT_TRUE(result->renamed_paths.empty());
    EXPECT_TRUE(vcs->commits.empty());
}

TEST_F(ActionOrchestratorTest, NoActionsApprovesWithoutCommit) {
    auto result = run(responses::NO_ACTIONS);
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->files_changed);
    EXPECT_FALSE(result->commit_id.has_value());
    EXPECT_TRUE(vcs->commits.empty());
    EXPECT_EQ(stored().approval, std::optional<services::ApprovalState>(services::ApprovalState::Approved));
    EXPECT_FALSE(stored().commit_id.has_value());
    EXPECT_EQ(stored().content, responses::NO_ACTIONS);
}

// ============================================================================
// Search-Replace
// ============================================================================

TEST_F(ActionOrchestratorTest, FailingPatchIsSilent) {
    dir.write("src/a.ts", "const a = 1;\n");
    auto result = run(responses::FAILING_PATCH);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(dir.read("src/a.ts"), "const a = 1;\n");
    EXPECT_TRUE(result->warnings.empty());
    EXPECT_TRUE(result->errors.empty());
    EXPECT_FALSE(result->files_changed);
}

TEST_F(ActionOrchestratorTest, PatchOnMissingFileIsSilent) {
    auto result = run(responses::FAILING_PATCH);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->errors.empty());
    EXPECT_FALSE(dir.exists("src/a.ts"));
}

TEST_F(ActionOrchestratorTest, DryRunReportsIssues) {
    dir.write("src/a.ts", "const a = 1;\n");
    auto failing = parser::TagExtractor::extract(responses::FAILING_PATCH).actions;
    auto issues = ActionOrchestrator::dry_run_search_replace(failing, dir.path());
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].file_path, "src/a.ts");
    EXPECT_NE(issues[0].error.find("not found"), std::string::npos);

    auto passing = parser::TagExtractor::extract(responses::EVERY_KIND).actions;
    EXPECT_TRUE(ActionOrchestrator::dry_run_search_replace(passing, dir.path()).empty());
    EXPECT_EQ(dir.read("src/a.ts"), "const a = 1;\n");
}

TEST_F(ActionOrchestratorTest, DryRunReportsMissingFile) {
    auto actions = parser::TagExtractor::extract(responses::FAILING_PATCH).actions;
    auto issues = ActionOrchestrator::dry_run_search_replace(actions, dir.path());
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0], (PatchIssue{"src/a.ts", "File does not exist"}));
}

// ============================================================================
// Dependencies
// ============================================================================

TEST_F(ActionOrchestratorTest, DependenciesInstalledOnceAndTagsRewritten) {
    dir.write("package.json", "{}");
    auto result = run(responses::TWO_DEPENDENCY_TAGS);
    ASSERT_TRUE(result.has_value());

    ASSERT_EQ(packages->calls.size(), 1u);
    EXPECT_EQ(packages->calls[0], (std::vector<std::string>{"left", "right", "right", "extra"}));
    EXPECT_EQ(result->written_paths, std::vector<std::string>{"package.json"});

    const std::string& content = stored().content;
    EXPECT_NE(content.find(R"(<add-dependency packages="left right">added 3 packages</add-dependency>)"),
              std::string::npos);
    EXPECT_NE(content.find(R"(<add-dependency packages="right extra">added 3 packages</add-dependency>)"),
              std::string::npos);
    EXPECT_NE(content.find("Some prose in between."), std::string::npos);
    EXPECT_EQ(content.find("quill-output"), std::string::npos);

    ASSERT_EQ(vcs->commits.size(), 1u);
    EXPECT_EQ(vcs->commits[0].first, "[quill] added left, right, right, extra package(s), wrote 1 file(s)");
}

TEST_F(ActionOrchestratorTest, InstallFailureIsRecordedAsError) {
    packages->should_fail = true;
    auto result = run(responses::TWO_DEPENDENCY_TAGS);
    ASSERT_TRUE(result.has_value());

    ASSERT_EQ(result->errors.size(), 1u);
    EXPECT_EQ(result->errors[0].message, "Failed to add dependencies: left, right, right, extra");
    EXPECT_NE(stored().content.find("<quill-output type=\"error\" message=\"Failed to add dependencies"),
              std::string::npos);
    EXPECT_NE(stored().content.find("Mock install failed</add-dependency>"), std::string::npos);
}

// ============================================================================
// Uploads
// ============================================================================

TEST_F(ActionOrchestratorTest, UploadIdReplacedWithFileBytes) {
    TempDir uploads_dir{"quill_uploads"};
    uploads_dir.write("blob", "<svg/>");

    const std::string response = "<write path=\"public/logo.svg\">\n  UPLOAD_ABC \n</write>";
    store->add_assistant_message(kMessage, kConversation, response);
    auto orchestrator = make();
    orchestrator->uploads().add(kConversation, "UPLOAD_ABC",
                                PendingUpload{(uploads_dir.path() / "blob").string(), "logo.svg"});

    auto result = orchestrator->process(ProcessRequest{response, kConversation, kMessage, std::nullopt});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(dir.read("public/logo.svg"), "<svg/>");
    EXPECT_EQ(orchestrator->uploads().pending_count(kConversation), 0u);
}

TEST_F(ActionOrchestratorTest, UnreadableUploadRecordedAndBodyWritten) {
    const std::string response = "<write path=\"public/logo.svg\">UPLOAD_ABC</write>";
    store->add_assistant_message(kMessage, kConversation, response);
    auto orchestrator = make();
    orchestrator->uploads().add(kConversation, "UPLOAD_ABC", PendingUpload{"/nonexistent/blob", "logo.svg"});

    auto result = orchestrator->process(ProcessRequest{response, kConversation, kMessage, std::nullopt});
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->errors.size(), 1u);
    EXPECT_EQ(result->errors[0].message, "Failed to read uploaded file: logo.svg");
    EXPECT_EQ(result->errors[0].detail.rfind("[405] ", 0), 0u);
    EXPECT_NE(result->errors[0].detail.find("/nonexistent/blob"), std::string::npos);
    EXPECT_EQ(dir.read("public/logo.svg"), "UPLOAD_ABC");
}

// ============================================================================
// Remote Services
// ============================================================================

TEST_F(ActionOrchestratorTest, FunctionWriteAndDeleteReachRemote) {
    link_database();
    dir.write("supabase/functions/gone/index.ts", "old");

    auto result = run(
        R"(<delete path="supabase/functions/gone/index.ts"></delete>)"
        R"(<write path="supabase/functions/hello/index.ts">serve();</write>)");
    ASSERT_TRUE(result.has_value());

    EXPECT_EQ(remote->deleted, std::vector<std::string>{"gone"});
    ASSERT_EQ(remote->deployed.size(), 1u);
    EXPECT_EQ(remote->deployed[0], (std::pair<std::string, std::string>{"hello", "serve();"}));
    EXPECT_TRUE(result->errors.empty());
}

TEST_F(ActionOrchestratorTest, DeployFailureRecordedAsError) {
    link_database();
    remote->should_fail_deploy = true;

    auto result = run(R"(<write path="supabase/functions/hello/index.ts">serve();</write>)");
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->errors.size(), 1u);
    EXPECT_EQ(result->errors[0].message, "Failed to deploy remote function: supabase/functions/hello/index.ts");
    EXPECT_EQ(dir.read("supabase/functions/hello/index.ts"), "serve();");
    EXPECT_EQ(vcs->commits.size(), 1u);
}

TEST_F(ActionOrchestratorTest, RenamedFunctionRedeployed) {
    link_database();
    remote->should_fail_delete = true;
    dir.write("supabase/functions/a/index.ts", "handler();");

    auto result = run(R"(<rename from="supabase/functions/a" to="supabase/functions/b"></rename>)");
    ASSERT_TRUE(result.has_value());

    ASSERT_EQ(result->warnings.size(), 1u);
    EXPECT_EQ(result->warnings[0].message,
              "Failed to delete remote function: supabase/functions/a as part of renaming "
              "supabase/functions/a to supabase/functions/b");
    ASSERT_EQ(remote->deployed.size(), 1u);
    EXPECT_EQ(remote->deployed[0], (std::pair<std::string, std::string>{"b", "handler();"}));
    EXPECT_TRUE(result->errors.empty());
}

TEST_F(ActionOrchestratorTest, FunctionWithoutLinkedProjectIsError) {
    auto result = run(R"(<write path="supabase/functions/hello/index.ts">serve();</write>)");
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->errors.size(), 1u);
    EXPECT_TRUE(remote->deployed.empty());
}

TEST_F(ActionOrchestratorTest, SqlWrittenAsMigration) {
    link_database();
    dir.write("supabase/migrations/0003_earlier.sql", "select 1;\n");
    Config config;
    config.write_sql_migrations = true;

    auto result = run(R"(<execute-sql description="Create users">CREATE TABLE users (id int);</execute-sql>)", config);
    ASSERT_TRUE(result.has_value());

    EXPECT_EQ(remote->executed_sql, std::vector<std::string>{"CREATE TABLE users (id int);"});
    EXPECT_EQ(result->written_paths, std::vector<std::string>{"supabase/migrations/0004_create_users.sql"});
    EXPECT_EQ(dir.read("supabase/migrations/0004_create_users.sql"), "CREATE TABLE users (id int);\n");
    ASSERT_EQ(vcs->commits.size(), 1u);
    EXPECT_EQ(vcs->commits[0].first, "[quill] executed 1 SQL queries, wrote 1 file(s)");
}

TEST_F(ActionOrchestratorTest, SqlFailureRecordedAsError) {
    link_database();
    remote->should_fail_sql = true;
    auto result = run(R"(<execute-sql>DROP TABLE x;</execute-sql>)");
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->errors.size(), 1u);
    EXPECT_EQ(result->errors[0].message, "Failed to execute SQL query: DROP TABLE x;");
}

// ============================================================================
// Fatal Errors
// ============================================================================

TEST_F(ActionOrchestratorTest, SnapshotFailureAbortsButFlushesWarnings) {
    project.database_branch_id = "branch-1";
    store->add_project(kConversation, project);
    branching->should_fail = true;

    auto result = run(responses::MISSING_PATH_THEN_VALID);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::DatabaseSnapshotFailed);

    EXPECT_FALSE(dir.exists("kept.ts"));
    EXPECT_TRUE(vcs->commits.empty());
    EXPECT_FALSE(stored().approval.has_value());
    EXPECT_NE(stored().content.find("<quill-output type=\"warning\" message=\"Skipped a malformed tag\">"),
              std::string::npos);
}

TEST_F(ActionOrchestratorTest, BranchWithoutBranchingServiceAborts) {
    project.database_branch_id = "branch-1";
    store->add_project(kConversation, project);
    store->add_assistant_message(kMessage, kConversation, responses::NO_ACTIONS);

    ActionOrchestrator::Services services{store, vcs, packages, nullptr, nullptr, nullptr};
    auto orchestrator = ActionOrchestrator::create(std::move(services));
    ASSERT_TRUE(orchestrator.has_value());
    auto result = (*orchestrator)->process(ProcessRequest{responses::NO_ACTIONS, kConversation, kMessage, std::nullopt});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::DatabaseSnapshotFailed);
}

TEST_F(ActionOrchestratorTest, SnapshotTakenBeforeChanges) {
    project.database_branch_id = "branch-1";
    store->add_project(kConversation, project);
    auto result = run(responses::NO_ACTIONS);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(branching->snapshots, 1);
}

TEST_F(ActionOrchestratorTest, ProjectNotFound) {
    store->projects.clear();
    auto result = run(responses::NO_ACTIONS);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ProjectNotFound);
}

TEST_F(ActionOrchestratorTest, MessageNotFound) {
    auto orchestrator = make();
    auto result = orchestrator->process(ProcessRequest{responses::NO_ACTIONS, kConversation, 999, std::nullopt});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::MessageNotFound);
}

TEST_F(ActionOrchestratorTest, CommitFailureAbortsWithoutApproval) {
    vcs->should_fail_commit = true;
    auto result = run(R"(<write path="a.ts">x</write>)");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::CommitFailed);
    EXPECT_FALSE(stored().approval.has_value());
    EXPECT_EQ(dir.read("a.ts"), "x");
}

TEST_F(ActionOrchestratorTest, EscapingPathSkippedWithWarning) {
    auto result = run(R"(<write path="../outside.ts">x</write>)");
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->warnings.size(), 1u);
    EXPECT_FALSE(std::filesystem::exists(dir.path().parent_path() / "outside.ts"));
}

// ============================================================================
// Annotations and Out-of-band Files
// ============================================================================

TEST_F(ActionOrchestratorTest, OutOfBandFilesAmended) {
    vcs->uncommitted = {"README.md"};
    auto result = run(R"(<write path="a.ts">x</write>)");
    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(result->out_of_band_files.has_value());
    EXPECT_EQ(*result->out_of_band_files, std::vector<std::string>{"README.md"});
    EXPECT_EQ(result->commit_id, std::optional<std::string>("commit-2"));
    EXPECT_EQ(stored().commit_id, std::optional<std::string>("commit-2"));
}

TEST_F(ActionOrchestratorTest, AnnotationStoreFailureSurfacesAsError) {
    store->should_fail_update = true;
    auto result = run(responses::MISSING_PATH_THEN_VALID);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(dir.read("kept.ts"), "kept");
    ASSERT_EQ(result->errors.size(), 1u);
    EXPECT_EQ(result->errors[0].message, "Failed to store annotations");
}

TEST_F(ActionOrchestratorTest, RenderAnnotationsWarningsFirstAndEscaped) {
    ActionLog log;
    log.error("Failed \"x\"", "boom");
    log.warn("Careful", "detail");
    EXPECT_EQ(ActionOrchestrator::render_annotations(log),
              "<quill-output type=\"warning\" message=\"Careful\">detail</quill-output>\n"
              "<quill-output type=\"error\" message=\"Failed &quot;x&quot;\">boom</quill-output>");
}
