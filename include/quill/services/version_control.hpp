#pragma once

#include "../types.hpp"
#include <string>
#include <vector>

namespace quill {
namespace services {

/**
 * @brief Version-control operations used by the commit manager.
 *
 * Paths are project-relative with forward slashes.
 */
class IVersionControl {
public:
    virtual ~IVersionControl() = default;

    /// Stage a file that exists in the working tree.
    virtual Expected<void> add(const std::string& root, const std::string& path) = 0;

    /// Stage the removal of a tracked path.
    virtual Expected<void> remove(const std::string& root, const std::string& path) = 0;

    /// Stage every change in the working tree, untracked files included.
    virtual Expected<void> add_all(const std::string& root) = 0;

    /**
     * @brief Commit the index.
     *
     * @param amend Replace the previous commit instead of creating a new one
     * @return The resulting commit id
     */
    virtual Expected<std::string> commit(const std::string& root, const std::string& message, bool amend) = 0;

    /// Paths with uncommitted changes (modified, added, deleted or untracked).
    virtual Expected<std::vector<std::string>> list_uncommitted(const std::string& root) = 0;
};

} // namespace services
} // namespace quill
