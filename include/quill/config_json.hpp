#pragma once

#include "types.hpp"
#include <chrono>
#include <fstream>
#include <nlohmann/json.hpp>
#include <string>

namespace quill {

/**
 * @brief Pipeline and sandbox configuration read from one JSON document.
 *
 * @code{.json}
 * {
 *   "product_marker": "[quill]",
 *   "functions_dir": "supabase/functions",
 *   "write_sql_migrations": true,
 *   "migrations_dir": "supabase/migrations",
 *   "manifest_files": ["package.json", "pnpm-lock.yaml"],
 *   "sandbox": {
 *     "worker_command": ["quill_check_worker"],
 *     "checker_command": ["tsc", "--noEmit", "-p", "{overlay}"],
 *     "timeout_ms": 30000
 *   }
 * }
 * @endcode
 *
 * Every key is optional; missing keys keep their defaults. Both configs are
 * validated before they are returned.
 */
struct Settings {
    Config pipeline;
    SandboxConfig sandbox;

    static Expected<Settings> from_json(const nlohmann::json& j) {
        Settings settings;
        try {
            if (!j.is_object()) {
                return tl::unexpected(Error{ErrorCode::InvalidConfig, "Configuration must be a JSON object"});
            }
            auto& p = settings.pipeline;
            p.product_marker = j.value("product_marker", p.product_marker);
            p.functions_dir = j.value("functions_dir", p.functions_dir);
            p.write_sql_migrations = j.value("write_sql_migrations", p.write_sql_migrations);
            p.migrations_dir = j.value("migrations_dir", p.migrations_dir);
            if (j.contains("manifest_files")) {
                p.manifest_files = j.at("manifest_files").get<std::vector<std::string>>();
            }

            if (j.contains("sandbox")) {
                const auto& s = j.at("sandbox");
                auto& sandbox = settings.sandbox;
                if (s.contains("worker_command")) {
                    sandbox.worker_command = s.at("worker_command").get<std::vector<std::string>>();
                }
                if (s.contains("checker_command")) {
                    sandbox.checker_command = s.at("checker_command").get<std::vector<std::string>>();
                }
                if (s.contains("timeout_ms")) {
                    sandbox.timeout = std::chrono::milliseconds(s.at("timeout_ms").get<long long>());
                }
            }
        } catch (const nlohmann::json::exception& e) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, std::string("Invalid configuration: ") + e.what()});
        }

        if (auto valid = settings.pipeline.validate(); !valid) {
            return tl::unexpected(valid.error());
        }
        if (auto valid = settings.sandbox.validate(); !valid) {
            return tl::unexpected(valid.error());
        }
        return settings;
    }

    static Expected<Settings> load(const std::string& path) {
        std::ifstream in(path);
        if (!in) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Cannot open configuration file", path});
        }
        nlohmann::json j;
        try {
            in >> j;
        } catch (const nlohmann::json::exception& e) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, std::string("JSON parse error: ") + e.what(), path});
        }
        return from_json(j);
    }
};

} // namespace quill
