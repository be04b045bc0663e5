#include <gtest/gtest.h>
#include "quill/sandbox/overlay.hpp"
#include "mocks/temp_dir.hpp"

using namespace quill;
using namespace quill::sandbox;
using quill::testing::TempDir;
namespace fs = std::filesystem;

class OverlayBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        project.write("src/a.ts", "export const a = 1;\n");
        project.write("src/b.ts", "export const b = 2;\n");
        project.write("src/lib/c.ts", "export const c = 3;\n");
        project.write("tsconfig.json", "{}");
        project.write(".git/HEAD", "ref: refs/heads/main\n");
        project.write("node_modules/react/index.js", "module.exports = {};\n");
    }

    fs::path overlay() const { return cache.path() / "overlay"; }

    std::string read_overlay(const std::string& rel) const {
        std::ifstream in(overlay() / rel, std::ios::binary);
        return std::string{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    }

    TempDir project{"quill_overlay_project"};
    TempDir cache{"quill_overlay_cache"};
};

TEST_F(OverlayBuilderTest, CopiesProjectWithoutGit) {
    auto built = OverlayBuilder::build(project.path(), overlay(), VirtualChanges{});
    ASSERT_TRUE(built.has_value()) << built.error().to_string();
    EXPECT_EQ(*built, 4u);

    EXPECT_EQ(read_overlay("src/a.ts"), "export const a = 1;\n");
    EXPECT_FALSE(fs::exists(overlay() / ".git"));
    EXPECT_FALSE(fs::is_symlink(overlay() / "src/a.ts"));
}

TEST_F(OverlayBuilderTest, NodeModulesLinkedWhole) {
    auto built = OverlayBuilder::build(project.path(), overlay(), VirtualChanges{});
    ASSERT_TRUE(built.has_value());
    EXPECT_TRUE(fs::is_symlink(overlay() / "node_modules"));
    EXPECT_EQ(read_overlay("node_modules/react/index.js"), "module.exports = {};\n");
}

TEST_F(OverlayBuilderTest, AppliesChangesWithoutTouchingProject) {
    VirtualChanges changes;
    changes.deletes = {"src/b.ts"};
    changes.renames = {RenameAction{"src/lib", "src/util"}};
    changes.writes = {WriteAction{"src/a.ts", "export const a = 42;\n", std::nullopt},
                      WriteAction{"src/new.ts", "export {};\n", std::nullopt}};

    auto built = OverlayBuilder::build(project.path(), overlay(), changes);
    ASSERT_TRUE(built.has_value());

    EXPECT_EQ(read_overlay("src/a.ts"), "export const a = 42;\n");
    EXPECT_EQ(read_overlay("src/new.ts"), "export {};\n");
    EXPECT_EQ(read_overlay("src/util/c.ts"), "export const c = 3;\n");
    EXPECT_FALSE(fs::exists(overlay() / "src/b.ts"));
    EXPECT_FALSE(fs::exists(overlay() / "src/lib"));

    EXPECT_EQ(project.read("src/a.ts"), "export const a = 1;\n");
    EXPECT_TRUE(project.exists("src/b.ts"));
    EXPECT_TRUE(project.exists("src/lib/c.ts"));
    EXPECT_FALSE(project.exists("src/new.ts"));
}

TEST_F(OverlayBuilderTest, RebuildDropsStaleFiles) {
    VirtualChanges first;
    first.writes = {WriteAction{"src/tmp.ts", "x", std::nullopt}};
    ASSERT_TRUE(OverlayBuilder::build(project.path(), overlay(), first).has_value());
    ASSERT_TRUE(fs::exists(overlay() / "src/tmp.ts"));

    ASSERT_TRUE(OverlayBuilder::build(project.path(), overlay(), VirtualChanges{}).has_value());
    EXPECT_FALSE(fs::exists(overlay() / "src/tmp.ts"));
}

TEST_F(OverlayBuilderTest, RejectsOverlayAtOrAboveProject) {
    auto same = OverlayBuilder::build(project.path(), project.path(), VirtualChanges{});
    ASSERT_FALSE(same.has_value());
    EXPECT_EQ(same.error().code, ErrorCode::OverlayFailed);

    auto parent = OverlayBuilder::build(project.path(), project.path().parent_path(), VirtualChanges{});
    ASSERT_FALSE(parent.has_value());
    EXPECT_EQ(parent.error().code, ErrorCode::OverlayFailed);
}

TEST_F(OverlayBuilderTest, MissingProjectRoot) {
    auto built = OverlayBuilder::build(project.path() / "missing", overlay(), VirtualChanges{});
    ASSERT_FALSE(built.has_value());
    EXPECT_EQ(built.error().code, ErrorCode::InvalidProjectRoot);
}

TEST_F(OverlayBuilderTest, OverlayLocationStablePerProject) {
    EXPECT_EQ(OverlayBuilder::overlay_dir(cache.path(), project.path()),
              OverlayBuilder::overlay_dir(cache.path(), project.path() / "src" / ".."));
    EXPECT_NE(OverlayBuilder::project_key(project.path()), OverlayBuilder::project_key(cache.path()));
}

TEST(VirtualChangesTest, CollectsFileActionsOnly) {
    std::vector<Action> actions = {
        WriteAction{"a.ts", "x", std::nullopt},
        AddDependencyAction{{"zod"}},
        RenameAction{"b.ts", "c.ts"},
        DeleteAction{"d.ts"},
        ChatSummaryAction{"summary"}
    };
    auto changes = VirtualChanges::from_actions(actions);
    EXPECT_EQ(changes.writes.size(), 1u);
    EXPECT_EQ(changes.renames.size(), 1u);
    EXPECT_EQ(changes.deletes, std::vector<std::string>{"d.ts"});
    EXPECT_FALSE(changes.empty());
    EXPECT_TRUE(VirtualChanges{}.empty());
}
