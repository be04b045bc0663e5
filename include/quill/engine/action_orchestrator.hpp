#pragma once

#include "../types.hpp"
#include "../log.hpp"
#include "../parser/path_utils.hpp"
#include "../parser/tag_extractor.hpp"
#include "../services/message_store.hpp"
#include "../services/package_manager.hpp"
#include "../services/remote_service.hpp"
#include "../services/version_control.hpp"
#include "commit_manager.hpp"
#include "patch_engine.hpp"
#include "upload_registry.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace quill {
namespace engine {

/** @brief One assistant response to execute. */
struct ProcessRequest {
    std::string response_text;
    ConversationId conversation_id = 0;
    MessageId message_id = 0;
    std::optional<std::string> chat_summary;  ///< Overrides the response's own chat-summary tag
};

/** @brief A search-replace that would not apply, found by the dry run. */
struct PatchIssue {
    std::string file_path;
    std::string error;

    bool operator==(const PatchIssue& other) const {
        return file_path == other.file_path && error == other.error;
    }
    bool operator!=(const PatchIssue& other) const { return !(*this == other); }
};

/**
 * @brief Accumulator threaded through the orchestrator steps.
 *
 * Steps append recoverable issues and changed paths here and return only
 * fatal errors. Whatever is in the log when the run ends, successful or not,
 * is written back onto the message.
 */
struct ActionLog {
    std::string content;           ///< Message content; the dependency step rewrites tag bodies
    std::vector<Output> warnings;
    std::vector<Output> errors;
    ChangeSet changes;

    void warn(std::string message, std::string detail) {
        warnings.push_back(Output{std::move(message), std::move(detail)});
    }

    void error(std::string message, std::string detail) {
        errors.push_back(Output{std::move(message), std::move(detail)});
    }
};

/**
 * @brief Executes the actions of one assistant response against a project.
 *
 * Steps run in a fixed order: database snapshot, SQL, dependencies, deletes,
 * renames, search-replace, writes. Then the changes are committed and the
 * message is approved. Per-action failures are collected and do not stop
 * the run; anything else aborts it with a single error. In both cases the
 * collected warnings and errors are appended to the stored message as
 * `<quill-output>` annotations.
 *
 * Collaborators are injected so tests can substitute them. `remote` and
 * `branching` may be null for projects without a linked database.
 *
 * @threadsafety Invocations for different conversations may run
 * concurrently if the injected services allow it.
 */
class ActionOrchestrator {
public:
    struct Services {
        std::shared_ptr<services::IMessageStore> store;
        std::shared_ptr<services::IVersionControl> vcs;
        std::shared_ptr<services::IPackageManager> packages;
        std::shared_ptr<services::IRemoteService> remote;
        std::shared_ptr<services::IDatabaseBranching> branching;
        std::shared_ptr<UploadRegistry> uploads;
    };

    /**
     * @brief Create an orchestrator.
     *
     * @return Error if the config is invalid or a required service is missing
     */
    static Expected<std::unique_ptr<ActionOrchestrator>> create(Services services, Config config = {}) {
        if (auto valid = config.validate(); !valid) {
            return tl::unexpected(valid.error());
        }
        if (!services.store || !services.vcs || !services.packages) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig,
                                        "Message store, version control and package manager are required"});
        }
        if (!services.uploads) {
            services.uploads = std::make_shared<UploadRegistry>();
        }
        return std::unique_ptr<ActionOrchestrator>(new ActionOrchestrator(std::move(services), std::move(config)));
    }

    const Config& config() const { return config_; }

    UploadRegistry& uploads() { return *services_.uploads; }

    /**
     * @brief Run the full pipeline for one response.
     *
     * @return Summary of what changed, or the error that aborted the run
     */
    Expected<ExecutionResult> process(const ProcessRequest& request) {
        // Consumed up front so a failed run cannot leave stale uploads behind.
        UploadMap uploads = services_.uploads->take(request.conversation_id);

        auto project = services_.store->find_project_for_conversation(request.conversation_id);
        if (!project) {
            return tl::unexpected(project.error());
        }
        if (!project->has_value()) {
            logger()->error("No project found for conversation {}", request.conversation_id);
            return tl::unexpected(Error{ErrorCode::ProjectNotFound,
                                        "No project found for conversation " + std::to_string(request.conversation_id)});
        }

        auto message = services_.store->find_message(request.message_id, services::Role::Assistant,
                                                     request.conversation_id);
        if (!message) {
            return tl::unexpected(message.error());
        }
        if (!message->has_value()) {
            logger()->error("No message found for ID {}", request.message_id);
            return tl::unexpected(Error{ErrorCode::MessageNotFound,
                                        "No assistant message " + std::to_string(request.message_id) +
                                        " in conversation " + std::to_string(request.conversation_id)});
        }

        Run run{**project, std::filesystem::path((*project)->root_path), {}, std::move(uploads), request.chat_summary};
        ActionLog log;
        log.content = request.response_text;

        auto outcome = execute(request, run, log);
        flush_annotations(request, log, outcome);
        return outcome;
    }

    /**
     * @brief Check every search-replace action against the files on disk.
     *
     * Nothing is written. The same patch function as the real run is used,
     * so an empty result means every search-replace would apply.
     */
    static std::vector<PatchIssue> dry_run_search_replace(
        const std::vector<Action>& actions,
        const std::filesystem::path& project_root
    ) {
        std::vector<PatchIssue> issues;
        for (const auto& action : actions_of<SearchReplaceAction>(actions)) {
            auto full = parser::safe_join(project_root, action.path);
            if (!full) {
                issues.push_back(PatchIssue{action.path, full.error().message});
                continue;
            }
            std::error_code ec;
            if (!std::filesystem::is_regular_file(*full, ec)) {
                issues.push_back(PatchIssue{action.path, "File does not exist"});
                continue;
            }
            auto original = read_file(*full);
            if (!original) {
                issues.push_back(PatchIssue{action.path, original.error().message});
                continue;
            }
            auto patched = PatchEngine::apply(*original, action.rules);
            if (!patched) {
                issues.push_back(PatchIssue{action.path, patched.error().message});
            }
        }
        return issues;
    }

    /// Render collected issues as `<quill-output>` lines, warnings first.
    static std::string render_annotations(const ActionLog& log) {
        std::string out;
        auto append = [&out](const char* type, const Output& output) {
            if (!out.empty()) out += "\n";
            out += std::string("<") + parser::tags::Output + " type=\"" + type + "\" message=\"" +
                   escape_attribute(output.message) + "\">" + output.detail + "</" + parser::tags::Output + ">";
        };
        for (const auto& warning : log.warnings) append("warning", warning);
        for (const auto& error : log.errors) append("error", error);
        return out;
    }

private:
    /// Per-invocation state shared by the steps.
    struct Run {
        services::ProjectRecord project;
        std::filesystem::path root;
        std::vector<Action> actions;
        UploadMap uploads;
        std::optional<std::string> summary;
    };

    ActionOrchestrator(Services services, Config config)
        : services_(std::move(services))
        , config_(std::move(config)) {}

    static std::shared_ptr<spdlog::logger> logger() {
        return log::get("quill.orchestrator");
    }

    Expected<ExecutionResult> execute(const ProcessRequest& request, Run& run, ActionLog& log) {
        try {
            auto extracted = parser::TagExtractor::extract(request.response_text);
            run.actions = std::move(extracted.actions);
            for (const auto& warning : extracted.warnings) {
                log.warn("Skipped a malformed tag", warning);
            }
            if (!run.summary.has_value()) {
                run.summary = parser::find_chat_summary(run.actions);
            }

            for (auto step : {&ActionOrchestrator::snapshot_database,
                              &ActionOrchestrator::execute_sql,
                              &ActionOrchestrator::add_dependencies,
                              &ActionOrchestrator::apply_deletes,
                              &ActionOrchestrator::apply_renames,
                              &ActionOrchestrator::apply_search_replace,
                              &ActionOrchestrator::apply_writes}) {
                if (auto done = (this->*step)(run, log); !done) {
                    logger()->error("Aborting action processing: {}", done.error().to_string());
                    return tl::unexpected(done.error());
                }
            }

            return finalize(request, run, log);
        } catch (const std::exception& e) {
            logger()->error("Unexpected error while processing actions: {}", e.what());
            return tl::unexpected(Error{ErrorCode::Unknown,
                                        std::string("Unexpected error while processing actions: ") + e.what()});
        }
    }

    // ========================================================================
    // Steps
    // ========================================================================

    /// Aggregates nothing. Propagates DatabaseSnapshotFailed.
    Expected<void> snapshot_database(Run& run, ActionLog&) {
        if (!run.project.database_branch_id.has_value()) {
            return {};
        }
        if (!services_.branching) {
            return tl::unexpected(Error{ErrorCode::DatabaseSnapshotFailed,
                                        "Project has a database branch but no branching service is configured",
                                        *run.project.database_branch_id});
        }
        auto snapshot = services_.branching->snapshot_at_current_version(run.project);
        if (!snapshot) {
            return tl::unexpected(Error{ErrorCode::DatabaseSnapshotFailed,
                                        "Failed to snapshot database branch: " + snapshot.error().message,
                                        *run.project.database_branch_id});
        }
        logger()->info("Snapshotted database branch {}", *run.project.database_branch_id);
        return {};
    }

    /// Aggregates SQL and migration failures as errors, migrations as written paths.
    Expected<void> execute_sql(Run& run, ActionLog& log) {
        if (!run.project.linked_database_project_id.has_value()) {
            return {};
        }
        const auto queries = actions_of<ExecuteSqlAction>(run.actions);
        if (queries.empty()) {
            return {};
        }

        for (const auto& query : queries) {
            auto executed = remote().and_then([&](services::IRemoteService* remote) {
                return remote->execute_sql(*run.project.linked_database_project_id, query.statement);
            });
            if (!executed) {
                log.error("Failed to execute SQL query: " + query.statement, executed.error().to_string());
                continue;
            }

            if (config_.write_sql_migrations) {
                auto migration = write_migration(run.root, query);
                if (migration) {
                    log.changes.written.push_back(*migration);
                } else {
                    log.error("Failed to write SQL migration file for: " + query.description.value_or(query.statement),
                              migration.error().to_string());
                }
            }
        }
        log.changes.sql_count = queries.size();
        logger()->info("Executed {} SQL queries", queries.size());
        return {};
    }

    /// Aggregates the install failure as an error and existing manifests as written paths.
    Expected<void> add_dependencies(Run& run, ActionLog& log) {
        std::vector<std::string> packages;
        for (const auto& tag : actions_of<AddDependencyAction>(run.actions)) {
            packages.insert(packages.end(), tag.packages.begin(), tag.packages.end());
        }
        if (packages.empty()) {
            return {};
        }

        std::string install_text;
        auto installed = services_.packages->install(packages, run.root.string());
        if (installed) {
            install_text = installed->stdout_text;
            if (!installed->stderr_text.empty()) {
                install_text += "\n" + installed->stderr_text;
            }
        } else {
            install_text = installed.error().to_string();
            log.error("Failed to add dependencies: " + join(packages, ", "), installed.error().to_string());
        }
        log.content = replace_tag_bodies(log.content, parser::tags::AddDependency, install_text);
        log.changes.packages = packages;

        for (const auto& manifest : config_.manifest_files) {
            std::error_code ec;
            if (std::filesystem::exists(run.root / manifest, ec)) {
                log.changes.written.push_back(manifest);
            }
        }
        return {};
    }

    /// Aggregates remote teardown failures as errors. Propagates filesystem failures.
    Expected<void> apply_deletes(Run& run, ActionLog& log) {
        namespace fs = std::filesystem;
        for (const auto& del : actions_of<DeleteAction>(run.actions)) {
            auto full = parser::safe_join(run.root, del.path);
            if (!full) {
                return tl::unexpected(full.error());
            }

            std::error_code ec;
            if (fs::exists(fs::symlink_status(*full, ec))) {
                fs::remove_all(*full, ec);
                if (ec) {
                    return tl::unexpected(Error{ErrorCode::FileOperationFailed,
                                                "Failed to delete " + del.path + ": " + ec.message(), full->string()});
                }
                logger()->info("Deleted {}", del.path);
                log.changes.deleted.push_back(del.path);
            } else {
                logger()->warn("File to delete does not exist: {}", del.path);
            }

            if (parser::is_server_function(del.path, config_.functions_dir)) {
                auto removed = remove_function(run.project, del.path);
                if (!removed) {
                    log.error("Failed to delete remote function: " + del.path, removed.error().to_string());
                }
            }
        }
        return {};
    }

    /**
     * Aggregates remote delete failures of the old unit as warnings and
     * deploy failures of the new unit as errors. Propagates filesystem failures.
     */
    Expected<void> apply_renames(Run& run, ActionLog& log) {
        namespace fs = std::filesystem;
        for (const auto& rename : actions_of<RenameAction>(run.actions)) {
            auto from = parser::safe_join(run.root, rename.from);
            if (!from) {
                return tl::unexpected(from.error());
            }
            auto to = parser::safe_join(run.root, rename.to);
            if (!to) {
                return tl::unexpected(to.error());
            }

            std::error_code ec;
            fs::create_directories(to->parent_path(), ec);
            if (ec) {
                return tl::unexpected(Error{ErrorCode::FileOperationFailed,
                                            "Failed to create directory: " + ec.message(),
                                            to->parent_path().string()});
            }

            if (fs::exists(fs::symlink_status(*from, ec))) {
                fs::rename(*from, *to, ec);
                if (ec) {
                    return tl::unexpected(Error{ErrorCode::FileOperationFailed,
                                                "Failed to rename " + rename.from + " to " + rename.to + ": " +
                                                ec.message()});
                }
                logger()->info("Renamed {} -> {}", rename.from, rename.to);
                log.changes.renamed.push_back(RenamedPath{rename.from, rename.to});
            } else {
                logger()->warn("Source file for rename does not exist: {}", rename.from);
            }

            const std::string context = " as part of renaming " + rename.from + " to " + rename.to;
            if (parser::is_server_function(rename.from, config_.functions_dir)) {
                auto removed = remove_function(run.project, rename.from);
                if (!removed) {
                    log.warn("Failed to delete remote function: " + rename.from + context,
                             removed.error().to_string());
                }
            }
            if (parser::is_server_function(rename.to, config_.functions_dir)) {
                auto deployed = read_function_source(*to).and_then([&](const std::string& source) {
                    return deploy_function(run.project, rename.to, source);
                });
                if (!deployed) {
                    log.error("Failed to deploy remote function: " + rename.to + context,
                              deployed.error().to_string());
                }
            }
        }
        return {};
    }

    /**
     * Missing targets and patch failures are logged only; a later write or
     * search-replace in the same response is expected to repair them.
     * Aggregates I/O and deploy failures as errors.
     */
    Expected<void> apply_search_replace(Run& run, ActionLog& log) {
        for (const auto& edit : actions_of<SearchReplaceAction>(run.actions)) {
            auto full = parser::safe_join(run.root, edit.path);
            if (!full) {
                log.error("Error applying search-replace to " + edit.path, full.error().to_string());
                continue;
            }

            std::error_code ec;
            if (!std::filesystem::exists(*full, ec)) {
                logger()->warn("Search-replace target file does not exist: {}", edit.path);
                continue;
            }

            auto original = read_file(*full);
            if (!original) {
                log.error("Error applying search-replace to " + edit.path, original.error().to_string());
                continue;
            }
            auto patched = PatchEngine::apply(*original, edit.rules);
            if (!patched) {
                logger()->warn("Failed to apply search-replace to {}: {}", edit.path, patched.error().message);
                continue;
            }
            if (auto written = write_file(*full, *patched); !written) {
                log.error("Error applying search-replace to " + edit.path, written.error().to_string());
                continue;
            }
            log.changes.written.push_back(edit.path);

            if (parser::is_server_function(edit.path, config_.functions_dir)) {
                auto deployed = deploy_function(run.project, edit.path, *patched);
                if (!deployed) {
                    log.error("Failed to deploy remote function after search-replace: " + edit.path,
                              deployed.error().to_string());
                }
            }
        }
        return {};
    }

    /// Aggregates upload read and deploy failures as errors. Propagates filesystem failures.
    Expected<void> apply_writes(Run& run, ActionLog& log) {
        for (const auto& write : actions_of<WriteAction>(run.actions)) {
            auto full = parser::safe_join(run.root, write.path);
            if (!full) {
                return tl::unexpected(full.error());
            }

            std::string content = write.content;
            bool from_upload = false;
            auto upload = run.uploads.find(parser::detail::trim(write.content));
            if (upload != run.uploads.end()) {
                auto bytes = read_file(upload->second.file_path);
                if (bytes) {
                    content = std::move(*bytes);
                    from_upload = true;
                    logger()->info("Replaced upload id {} with {}", upload->first, upload->second.original_name);
                } else {
                    const Error failure{
                        ErrorCode::UploadReadFailed,
                        "Failed to read uploaded file: " + bytes.error().message,
                        upload->second.file_path
                    };
                    logger()->error("Failed to read uploaded file {}: {}", upload->second.original_name,
                                    bytes.error().message);
                    log.error("Failed to read uploaded file: " + upload->second.original_name,
                              failure.to_string());
                }
            }

            std::error_code ec;
            std::filesystem::create_directories(full->parent_path(), ec);
            if (ec) {
                return tl::unexpected(Error{ErrorCode::FileOperationFailed,
                                            "Failed to create directory: " + ec.message(),
                                            full->parent_path().string()});
            }
            if (auto written = write_file(*full, content); !written) {
                return tl::unexpected(written.error());
            }
            logger()->info("Wrote {}", write.path);
            log.changes.written.push_back(write.path);

            if (!from_upload && parser::is_server_function(write.path, config_.functions_dir)) {
                auto deployed = deploy_function(run.project, write.path, content);
                if (!deployed) {
                    log.error("Failed to deploy remote function: " + write.path, deployed.error().to_string());
                }
            }
        }
        return {};
    }

    /// Commit (when anything changed) and approve. Propagates commit and store failures.
    Expected<ExecutionResult> finalize(const ProcessRequest& request, Run& run, ActionLog& log) {
        ExecutionResult result;
        result.files_changed = log.changes.has_changes();

        if (result.files_changed) {
            CommitManager committer(services_.vcs, config_.product_marker);
            auto committed = committer.commit(run.root.string(), log.changes, run.summary);
            if (!committed) {
                return tl::unexpected(committed.error());
            }
            if (!committed->out_of_band_files.empty()) {
                result.out_of_band_files = committed->out_of_band_files;
            }
            result.out_of_band_error = committed->out_of_band_error;
            result.commit_id = committed->commit_id;

            if (auto saved = services_.store->set_commit_id(request.message_id, committed->commit_id); !saved) {
                return tl::unexpected(saved.error());
            }
        }

        logger()->info("Marking message {} approved (changes: {})", request.message_id, result.files_changed);
        if (auto approved = services_.store->set_approval(request.message_id, services::ApprovalState::Approved);
            !approved) {
            return tl::unexpected(approved.error());
        }

        result.written_paths = log.changes.written;
        result.renamed_paths = log.changes.renamed;
        result.deleted_paths = log.changes.deleted;
        result.warnings = log.warnings;
        result.errors = log.errors;
        return result;
    }

    /// Runs on every exit path once the message is known.
    void flush_annotations(const ProcessRequest& request, const ActionLog& log, Expected<ExecutionResult>& outcome) {
        const std::string annotations = render_annotations(log);
        if (annotations.empty() && log.content == request.response_text) {
            return;
        }

        std::string content = log.content;
        if (!annotations.empty()) {
            content += "\n\n" + annotations;
        }
        auto updated = services_.store->update_content(request.message_id, content);
        if (!updated) {
            logger()->error("Failed to store annotations for message {}: {}", request.message_id,
                            updated.error().to_string());
            if (outcome) {
                outcome->errors.push_back(Output{"Failed to store annotations", updated.error().to_string()});
            }
        }
    }

    // ========================================================================
    // Remote helpers
    // ========================================================================

    Expected<services::IRemoteService*> remote() const {
        if (!services_.remote) {
            return tl::unexpected(Error{ErrorCode::RemoteServiceFailed, "No remote service configured"});
        }
        return services_.remote.get();
    }

    Expected<void> deploy_function(const services::ProjectRecord& project, const std::string& path,
                                   const std::string& content) {
        if (!project.linked_database_project_id.has_value()) {
            return tl::unexpected(Error{ErrorCode::RemoteServiceFailed, "Project has no linked database project", path});
        }
        return remote().and_then([&](services::IRemoteService* remote) {
            return remote->deploy_function(*project.linked_database_project_id,
                                           parser::function_name_from_path(path), content);
        });
    }

    Expected<void> remove_function(const services::ProjectRecord& project, const std::string& path) {
        if (!project.linked_database_project_id.has_value()) {
            return tl::unexpected(Error{ErrorCode::RemoteServiceFailed, "Project has no linked database project", path});
        }
        return remote().and_then([&](services::IRemoteService* remote) {
            return remote->delete_function(*project.linked_database_project_id,
                                           parser::function_name_from_path(path));
        });
    }

    /// Deployable source at a path: the file itself, or `index.ts` for a function directory.
    static Expected<std::string> read_function_source(const std::filesystem::path& path) {
        std::error_code ec;
        if (std::filesystem::is_directory(path, ec)) {
            return read_file(path / "index.ts");
        }
        return read_file(path);
    }

    // ========================================================================
    // File helpers
    // ========================================================================

    static Expected<std::string> read_file(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            return tl::unexpected(Error{ErrorCode::FileOperationFailed, "Cannot open file for reading", path.string()});
        }
        std::string content{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
        if (in.bad()) {
            return tl::unexpected(Error{ErrorCode::FileOperationFailed, "Failed to read file", path.string()});
        }
        return content;
    }

    static Expected<void> write_file(const std::filesystem::path& path, const std::string& content) {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out) {
            return tl::unexpected(Error{ErrorCode::FileOperationFailed, "Cannot open file for writing", path.string()});
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.close();
        if (!out) {
            return tl::unexpected(Error{ErrorCode::FileOperationFailed, "Failed to write file", path.string()});
        }
        return {};
    }

    /**
     * @brief Persist an executed statement as `<migrations_dir>/<NNNN>_<slug>.sql`.
     *
     * NNNN continues the highest number already present in the directory.
     *
     * @return Project-relative path of the migration
     */
    Expected<std::string> write_migration(const std::filesystem::path& root, const ExecuteSqlAction& query) {
        namespace fs = std::filesystem;
        auto dir = parser::safe_join(root, config_.migrations_dir);
        if (!dir) {
            return tl::unexpected(dir.error());
        }

        std::error_code ec;
        fs::create_directories(*dir, ec);
        if (ec) {
            return tl::unexpected(Error{ErrorCode::FileOperationFailed,
                                        "Failed to create migrations directory: " + ec.message(), dir->string()});
        }

        int next = 0;
        for (fs::directory_iterator it(*dir, ec), end; !ec && it != end; it.increment(ec)) {
            const std::string name = it->path().filename().string();
            if (name.size() > 5 && name[4] == '_' &&
                std::isdigit(static_cast<unsigned char>(name[0])) && std::isdigit(static_cast<unsigned char>(name[1])) &&
                std::isdigit(static_cast<unsigned char>(name[2])) && std::isdigit(static_cast<unsigned char>(name[3]))) {
                next = std::max(next, std::stoi(name.substr(0, 4)) + 1);
            }
        }
        if (ec) {
            return tl::unexpected(Error{ErrorCode::FileOperationFailed,
                                        "Failed to list migrations directory: " + ec.message(), dir->string()});
        }

        char number[8];
        std::snprintf(number, sizeof(number), "%04d", next);
        const std::string file_name = std::string(number) + "_" + slugify(query.description.value_or("")) + ".sql";

        auto written = write_file(*dir / file_name, query.statement + "\n");
        if (!written) {
            return tl::unexpected(written.error());
        }
        return parser::normalize_path(config_.migrations_dir + "/" + file_name).value_or(file_name);
    }

    static std::string slugify(const std::string& text) {
        std::string slug;
        for (unsigned char c : text) {
            if (std::isalnum(c)) {
                slug.push_back(static_cast<char>(std::tolower(c)));
            } else if (!slug.empty() && slug.back() != '_') {
                slug.push_back('_');
            }
            if (slug.size() >= 48) break;
        }
        while (!slug.empty() && slug.back() == '_') slug.pop_back();
        return slug.empty() ? "migration" : slug;
    }

    // ========================================================================
    // Content helpers
    // ========================================================================

    /// Replace the body of every closed `<name ...>...</name>` tag with `body`.
    static std::string replace_tag_bodies(const std::string& content, const std::string& name, const std::string& body) {
        const std::string lowered = parser::detail::to_lower(content);
        const std::string open = "<" + name;
        const std::string close = "</" + name + ">";

        std::string out;
        size_t pos = 0;
        while (true) {
            size_t start = lowered.find(open, pos);
            if (start == std::string::npos) break;

            size_t after = start + open.size();
            if (after >= content.size() ||
                !(std::isspace(static_cast<unsigned char>(content[after])) || content[after] == '>')) {
                out.append(content, pos, after - pos);
                pos = after;
                continue;
            }

            size_t head_end = find_unquoted_gt(content, after);
            if (head_end == std::string::npos) break;
            size_t close_at = lowered.find(close, head_end + 1);
            if (content[head_end - 1] == '/' || close_at == std::string::npos) {
                out.append(content, pos, head_end + 1 - pos);
                pos = head_end + 1;
                continue;
            }

            out.append(content, pos, head_end + 1 - pos);
            out += body;
            out.append(content, close_at, close.size());
            pos = close_at + close.size();
        }
        out.append(content, pos, std::string::npos);
        return out;
    }

    static size_t find_unquoted_gt(const std::string& text, size_t from) {
        bool in_quotes = false;
        for (size_t i = from; i < text.size(); ++i) {
            if (text[i] == '"') in_quotes = !in_quotes;
            else if (text[i] == '>' && !in_quotes) return i;
        }
        return std::string::npos;
    }

    static std::string escape_attribute(const std::string& text) {
        std::string out;
        out.reserve(text.size());
        for (char c : text) {
            if (c == '"') out += "&quot;";
            else out.push_back(c);
        }
        return out;
    }

    static std::string join(const std::vector<std::string>& items, const std::string& separator) {
        std::string out;
        for (size_t i = 0; i < items.size(); ++i) {
            if (i > 0) out += separator;
            out += items[i];
        }
        return out;
    }

    Services services_;
    Config config_;
};

} // namespace engine
} // namespace quill
