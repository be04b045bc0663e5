#pragma once

#include "../types.hpp"
#include "message_store.hpp"
#include <string>

namespace quill {
namespace services {

/**
 * @brief Remote database and function hosting linked to a project.
 *
 * Keyed by the project's linked database project id. Functions are
 * addressed by name (see parser::function_name_from_path).
 */
class IRemoteService {
public:
    virtual ~IRemoteService() = default;

    /// Run one SQL statement. Returns the service's textual result.
    virtual Expected<std::string> execute_sql(const std::string& database_project_id, const std::string& sql) = 0;

    virtual Expected<void> deploy_function(
        const std::string& database_project_id,
        const std::string& function_name,
        const std::string& content) = 0;

    virtual Expected<void> delete_function(
        const std::string& database_project_id,
        const std::string& function_name) = 0;
};

/// Point-in-time snapshots of a project's database branch.
class IDatabaseBranching {
public:
    virtual ~IDatabaseBranching() = default;

    virtual Expected<void> snapshot_at_current_version(const ProjectRecord& project) = 0;
};

} // namespace services
} // namespace quill
