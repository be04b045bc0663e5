#pragma once

#include "version_control.hpp"
#include "process_runner.hpp"
#include <string>
#include <vector>

namespace quill {
namespace services {

/**
 * @brief IVersionControl over the git command line.
 *
 * Every command runs as `git -C <root> ...` with the configured identity
 * passed through `-c`, so commits work in repositories without user config.
 */
class GitVersionControl : public IVersionControl {
public:
    struct Config {
        std::string git_executable = "git";
        std::string author_name = "Quill";
        std::string author_email = "quill@localhost";
    };

    GitVersionControl() = default;
    explicit GitVersionControl(Config config)
        : config_(std::move(config)) {}

    /// Create a repository at `root` (used by the CLI and tests).
    Expected<void> init(const std::string& root);

    Expected<void> add(const std::string& root, const std::string& path) override;
    Expected<void> remove(const std::string& root, const std::string& path) override;
    Expected<void> add_all(const std::string& root) override;
    Expected<std::string> commit(const std::string& root, const std::string& message, bool amend) override;
    Expected<std::vector<std::string>> list_uncommitted(const std::string& root) override;

    /// Parse `git status --porcelain` output into paths (renames yield the new path).
    static std::vector<std::string> parse_porcelain(const std::string& output);

private:
    Expected<ProcessResult> git(const std::string& root, const std::vector<std::string>& args);

    Config config_;
};

} // namespace services
} // namespace quill
