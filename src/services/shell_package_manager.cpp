#include "quill/services/package_manager.hpp"
#include "quill/services/process_runner.hpp"
#include "quill/log.hpp"

namespace quill {
namespace services {

namespace {

std::string failure_text(const Expected<ProcessResult>& result) {
    if (!result) {
        return result.error().message;
    }
    std::string text = result->stderr_text.empty() ? result->stdout_text : result->stderr_text;
    return "exit " + std::to_string(result->exit_code) + ": " + text;
}

} // namespace

Expected<InstallOutput> ShellPackageManager::install(const std::vector<std::string>& packages, const std::string& cwd) {
    auto logger = log::get("quill.packages");
    if (packages.empty()) {
        return tl::unexpected(Error{ErrorCode::DependencyInstallFailed, "No packages to install"});
    }

    std::vector<std::string> pnpm = {config_.pnpm_executable, "add", "--dir", cwd};
    pnpm.insert(pnpm.end(), packages.begin(), packages.end());

    logger->info("Installing {} package(s) with {}", packages.size(), config_.pnpm_executable);
    auto primary = run_process(pnpm);
    if (primary && primary->ok()) {
        return InstallOutput{primary->stdout_text, primary->stderr_text};
    }
    logger->warn("{} failed, falling back to {}: {}", config_.pnpm_executable, config_.npm_executable,
                 failure_text(primary));

    std::vector<std::string> npm = {config_.npm_executable, "install", "--legacy-peer-deps", "--prefix", cwd};
    npm.insert(npm.end(), packages.begin(), packages.end());

    auto fallback = run_process(npm);
    if (fallback && fallback->ok()) {
        return InstallOutput{fallback->stdout_text, fallback->stderr_text};
    }

    return tl::unexpected(Error{
        ErrorCode::DependencyInstallFailed,
        "Failed to install packages: " + failure_text(fallback),
        detail::join_command(npm)
    });
}

} // namespace services
} // namespace quill
