#pragma once

#include "../types.hpp"
#include "overlay.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace quill {
namespace sandbox {

/** @brief Request sent to the check worker on its stdin (one JSON line). */
struct WorkerInput {
    VirtualChanges changes;
    std::string project_root;
    std::string cache_dir;
    std::vector<std::string> checker_command;
};

/** @brief Reply written by the check worker on its stdout (one JSON line). */
struct WorkerOutput {
    bool success = false;
    std::optional<DiagnosticReport> data;
    std::optional<std::string> error;
};

/**
 * @brief JSON codec for the parent/worker exchange.
 *
 * All methods are static and stateless. Encoded messages never contain raw
 * newlines, so each message is exactly one line. Encoding never throws:
 * bytes that are not valid UTF-8 are replaced with U+FFFD.
 */
class WorkerProtocol {
public:
    // ========================================================================
    // Encoding
    // ========================================================================

    static std::string encode_input(const WorkerInput& input) {
        nlohmann::json writes = nlohmann::json::array();
        for (const auto& w : input.changes.writes) {
            writes.push_back({{"path", w.path}, {"content", w.content}});
        }
        nlohmann::json renames = nlohmann::json::array();
        for (const auto& r : input.changes.renames) {
            renames.push_back({{"from", r.from}, {"to", r.to}});
        }

        nlohmann::json j;
        j["virtualChanges"] = {
            {"writes", writes},
            {"renames", renames},
            {"deletes", input.changes.deletes}
        };
        j["projectRoot"] = input.project_root;
        j["cacheDir"] = input.cache_dir;
        j["checkerCommand"] = input.checker_command;
        return dump(j);
    }

    static std::string encode_output(const WorkerOutput& output) {
        nlohmann::json j;
        j["success"] = output.success;
        if (output.data.has_value()) {
            j["data"] = encode_report(*output.data);
        }
        if (output.error.has_value()) {
            j["error"] = *output.error;
        }
        return dump(j);
    }

    /// Serialize on one line; invalid UTF-8 becomes U+FFFD instead of throwing.
    static std::string dump(const nlohmann::json& j) {
        return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    static nlohmann::json encode_report(const DiagnosticReport& report) {
        nlohmann::json j = nlohmann::json::object();
        for (const auto& [path, diagnostics] : report) {
            nlohmann::json list = nlohmann::json::array();
            for (const auto& d : diagnostics) {
                list.push_back({
                    {"severity", severity_to_string(d.severity)},
                    {"line", d.line},
                    {"column", d.column},
                    {"code", d.code},
                    {"message", d.message}
                });
            }
            j[path] = std::move(list);
        }
        return j;
    }

    // ========================================================================
    // Decoding
    // ========================================================================

    static Expected<WorkerInput> decode_input(const std::string& line) {
        try {
            auto j = nlohmann::json::parse(line);
            WorkerInput input;
            const auto& changes = j.at("virtualChanges");
            for (const auto& w : changes.at("writes")) {
                input.changes.writes.push_back(WriteAction{
                    w.at("path").get<std::string>(), w.at("content").get<std::string>(), std::nullopt});
            }
            for (const auto& r : changes.at("renames")) {
                input.changes.renames.push_back(RenameAction{
                    r.at("from").get<std::string>(), r.at("to").get<std::string>()});
            }
            input.changes.deletes = changes.at("deletes").get<std::vector<std::string>>();
            input.project_root = j.at("projectRoot").get<std::string>();
            input.cache_dir = j.at("cacheDir").get<std::string>();
            input.checker_command = j.at("checkerCommand").get<std::vector<std::string>>();
            return input;
        } catch (const nlohmann::json::exception& e) {
            return tl::unexpected(Error{ErrorCode::SandboxProtocolError,
                                        std::string("Invalid worker input: ") + e.what()});
        }
    }

    static Expected<WorkerOutput> decode_output(const std::string& line) {
        try {
            auto j = nlohmann::json::parse(line);
            WorkerOutput output;
            output.success = j.at("success").get<bool>();
            if (j.contains("data")) {
                output.data = decode_report(j["data"]);
            }
            if (j.contains("error") && j["error"].is_string()) {
                output.error = j["error"].get<std::string>();
            }
            return output;
        } catch (const nlohmann::json::exception& e) {
            return tl::unexpected(Error{ErrorCode::SandboxProtocolError,
                                        std::string("Invalid worker output: ") + e.what(), line});
        }
    }

    static DiagnosticReport decode_report(const nlohmann::json& j) {
        DiagnosticReport report;
        for (const auto& [path, list] : j.items()) {
            auto& bucket = report[path];
            for (const auto& d : list) {
                const auto severity = d.value("severity", "error");
                bucket.push_back(Diagnostic{
                    severity == "warning" ? Severity::Warning
                        : severity == "message" ? Severity::Message : Severity::Error,
                    d.value("line", 0),
                    d.value("column", 0),
                    d.value("code", ""),
                    d.value("message", "")
                });
            }
        }
        return report;
    }
};

} // namespace sandbox
} // namespace quill
