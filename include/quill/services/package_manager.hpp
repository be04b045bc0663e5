#pragma once

#include "../types.hpp"
#include <string>
#include <vector>

namespace quill {
namespace services {

/// Text produced by a successful install, recorded into the message content.
struct InstallOutput {
    std::string stdout_text;
    std::string stderr_text;
};

class IPackageManager {
public:
    virtual ~IPackageManager() = default;

    /**
     * @brief Install packages into the project at `cwd`.
     *
     * One call installs the whole list; implementations must not split it.
     */
    virtual Expected<InstallOutput> install(const std::vector<std::string>& packages, const std::string& cwd) = 0;
};

/**
 * @brief Installs through the package-manager CLIs.
 *
 * Runs `pnpm add --dir <cwd> <packages...>`; when that fails, falls back to
 * `npm install --legacy-peer-deps --prefix <cwd> <packages...>`.
 */
class ShellPackageManager : public IPackageManager {
public:
    struct Config {
        std::string pnpm_executable = "pnpm";
        std::string npm_executable = "npm";
    };

    ShellPackageManager() = default;
    explicit ShellPackageManager(Config config)
        : config_(std::move(config)) {}

    Expected<InstallOutput> install(const std::vector<std::string>& packages, const std::string& cwd) override;

private:
    Config config_;
};

} // namespace services
} // namespace quill
