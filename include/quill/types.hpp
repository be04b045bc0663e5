#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include <tl/expected.hpp>

namespace quill {

// ============================================================================
// Error Types
// ============================================================================

/**
 * @brief Error codes organized by category range
 *
 * Error codes are grouped into ranges by category:
 * - 100-199: Configuration errors
 * - 200-299: Markup and patch errors
 * - 300-399: Compile-check sandbox errors
 * - 400-499: Pipeline errors
 * - 500-599: Collaborator service errors
 */
enum class ErrorCode {
    // Configuration errors (100-199)
    InvalidConfig = 100,
    InvalidProjectRoot = 101,
    InvalidCacheDir = 102,

    // Markup and patch errors (200-299)
    InvalidPath = 200,
    PatchMalformed = 201,
    PatchTargetNotFound = 202,
    PatchTargetAmbiguous = 203,

    // Sandbox errors (300-399)
    SandboxSpawnFailed = 300,
    SandboxTimeout = 301,
    SandboxWorkerCrashed = 302,
    SandboxWorkerFailed = 303,
    SandboxProtocolError = 304,
    OverlayFailed = 305,
    TypeCheckerFailed = 306,

    // Pipeline errors (400-499)
    ProjectNotFound = 400,
    MessageNotFound = 401,
    DatabaseSnapshotFailed = 402,
    FileOperationFailed = 403,
    CommitFailed = 404,
    UploadReadFailed = 405,

    // Service errors (500-599)
    ProcessSpawnFailed = 500,
    ProcessFailed = 501,
    StoreFailed = 502,
    VersionControlFailed = 503,
    DependencyInstallFailed = 504,
    RemoteServiceFailed = 505,

    // Unknown
    Unknown = 999
};

/**
 * @brief Error information with code, message, and optional context
 *
 * Value type representing a library error. Used with tl::expected for
 * composable error handling without exceptions.
 */
struct Error {
    ErrorCode code;                      ///< Categorized error code
    std::string message;                 ///< Human-readable error description
    std::optional<std::string> context;  ///< Additional context (e.g., file paths, command lines)

    Error(ErrorCode code, std::string message, std::optional<std::string> context = std::nullopt)
        : code(code), message(std::move(message)), context(std::move(context)) {}

    std::string to_string() const {
        std::string result = "[" + std::to_string(static_cast<int>(code)) + "] " + message;
        if (context.has_value()) {
            result += " | Context: " + *context;
        }
        return result;
    }
};

// Expected type alias
template<typename T>
using Expected = tl::expected<T, Error>;

// ============================================================================
// Record Identifiers
// ============================================================================

using ProjectId = int64_t;
using ConversationId = int64_t;
using MessageId = int64_t;

// ============================================================================
// Action Types
// ============================================================================

/// Create or overwrite a file with the tag body.
struct WriteAction {
    std::string path;
    std::string content;
    std::optional<std::string> description;

    bool operator==(const WriteAction& other) const {
        return path == other.path && content == other.content && description == other.description;
    }
    bool operator!=(const WriteAction& other) const { return !(*this == other); }
};

/// Move a file or directory within the project.
struct RenameAction {
    std::string from;
    std::string to;

    bool operator==(const RenameAction& other) const {
        return from == other.from && to == other.to;
    }
    bool operator!=(const RenameAction& other) const { return !(*this == other); }
};

/// Remove a file or directory (recursively).
struct DeleteAction {
    std::string path;

    bool operator==(const DeleteAction& other) const { return path == other.path; }
    bool operator!=(const DeleteAction& other) const { return !(*this == other); }
};

/// Install packages with the project's package manager.
struct AddDependencyAction {
    std::vector<std::string> packages;  ///< Emission order, duplicates kept

    bool operator==(const AddDependencyAction& other) const { return packages == other.packages; }
    bool operator!=(const AddDependencyAction& other) const { return !(*this == other); }
};

/// Run a SQL statement against the linked database project.
struct ExecuteSqlAction {
    std::string statement;
    std::optional<std::string> description;

    bool operator==(const ExecuteSqlAction& other) const {
        return statement == other.statement && description == other.description;
    }
    bool operator!=(const ExecuteSqlAction& other) const { return !(*this == other); }
};

/// Patch an existing file with SEARCH/REPLACE blocks.
struct SearchReplaceAction {
    std::string path;
    std::string rules;
    std::optional<std::string> description;

    bool operator==(const SearchReplaceAction& other) const {
        return path == other.path && rules == other.rules && description == other.description;
    }
    bool operator!=(const SearchReplaceAction& other) const { return !(*this == other); }
};

/// Metadata only: a one-line summary of the turn.
struct ChatSummaryAction {
    std::string text;

    bool operator==(const ChatSummaryAction& other) const { return text == other.text; }
    bool operator!=(const ChatSummaryAction& other) const { return !(*this == other); }
};

/// Opaque directive consumed outside the pipeline (e.g. "rebuild").
struct CommandAction {
    std::string type;

    bool operator==(const CommandAction& other) const { return type == other.type; }
    bool operator!=(const CommandAction& other) const { return !(*this == other); }
};

using Action = std::variant<
    WriteAction,
    RenameAction,
    DeleteAction,
    AddDependencyAction,
    ExecuteSqlAction,
    SearchReplaceAction,
    ChatSummaryAction,
    CommandAction
>;

/**
 * @brief Collect every action of one kind, preserving textual order.
 *
 * @code
 * auto writes = actions_of<WriteAction>(result.actions);
 * @endcode
 */
template<typename T>
std::vector<T> actions_of(const std::vector<Action>& actions) {
    std::vector<T> out;
    for (const auto& action : actions) {
        if (const auto* typed = std::get_if<T>(&action)) {
            out.push_back(*typed);
        }
    }
    return out;
}

// ============================================================================
// Diagnostic Types
// ============================================================================

enum class Severity {
    Error,
    Warning,
    Message
};

[[nodiscard]] inline const char* severity_to_string(Severity severity) {
    switch (severity) {
        case Severity::Error: return "error";
        case Severity::Warning: return "warning";
        case Severity::Message: return "message";
    }
    return "unknown";
}

/// Single type-checker finding.
struct Diagnostic {
    Severity severity = Severity::Error;
    int line = 0;                 ///< 1-based
    int column = 0;               ///< 1-based
    std::string code;             ///< Checker-specific code (e.g. "TS2322"), may be empty
    std::string message;

    bool operator==(const Diagnostic& other) const {
        return severity == other.severity &&
               line == other.line &&
               column == other.column &&
               code == other.code &&
               message == other.message;
    }
    bool operator!=(const Diagnostic& other) const { return !(*this == other); }
};

/// Project-relative path -> diagnostics in checker output order. Empty means clean.
using DiagnosticReport = std::map<std::string, std::vector<Diagnostic>>;

// ============================================================================
// Execution Result Types
// ============================================================================

/**
 * @brief A recoverable or advisory issue collected while executing actions
 *
 * `message` is the user-facing summary, `detail` the underlying error text.
 */
struct Output {
    std::string message;
    std::string detail;

    bool operator==(const Output& other) const {
        return message == other.message && detail == other.detail;
    }
    bool operator!=(const Output& other) const { return !(*this == other); }
};

struct RenamedPath {
    std::string from;
    std::string to;

    bool operator==(const RenamedPath& other) const {
        return from == other.from && to == other.to;
    }
    bool operator!=(const RenamedPath& other) const { return !(*this == other); }
};

/**
 * @brief Summary of one orchestrator invocation
 *
 * @threadsafety Safe to copy and pass by value across threads
 */
struct ExecutionResult {
    bool files_changed = false;                         ///< A commit was attempted for this turn
    std::vector<std::string> written_paths;             ///< Includes manifests and migrations
    std::vector<RenamedPath> renamed_paths;
    std::vector<std::string> deleted_paths;
    std::vector<Output> warnings;
    std::vector<Output> errors;
    std::optional<std::vector<std::string>> out_of_band_files;  ///< Files folded in by amend
    std::optional<std::string> out_of_band_error;               ///< Amend failure (advisory)
    std::optional<std::string> commit_id;
};

// ============================================================================
// Pipeline Configuration
// ============================================================================

/**
 * @brief Configuration for the action orchestrator and commit manager
 *
 * Must be validated via validate() before use.
 */
struct Config {
    std::string product_marker = "[quill]";              ///< Commit message prefix
    std::string functions_dir = "supabase/functions";    ///< Deployable units live below this directory
    bool write_sql_migrations = false;                   ///< Persist executed SQL as migration files
    std::string migrations_dir = "supabase/migrations";  ///< Project-relative migration directory
    std::vector<std::string> manifest_files = {"package.json", "pnpm-lock.yaml", "package-lock.json"};

    Expected<void> validate() const {
        if (product_marker.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "product_marker cannot be empty"});
        }
        if (functions_dir.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "functions_dir cannot be empty"});
        }
        if (write_sql_migrations && migrations_dir.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig,
                "migrations_dir is required when write_sql_migrations is enabled"});
        }
        return {};
    }

    bool operator==(const Config& other) const {
        return product_marker == other.product_marker &&
               functions_dir == other.functions_dir &&
               write_sql_migrations == other.write_sql_migrations &&
               migrations_dir == other.migrations_dir &&
               manifest_files == other.manifest_files;
    }
    bool operator!=(const Config& other) const { return !(*this == other); }
};

/**
 * @brief Configuration for the compile-check sandbox
 *
 * `worker_command` is the worker executable plus fixed arguments. The
 * checker command is run by the worker; the placeholders `{overlay}` and
 * `{tsbuildinfo}` are substituted per run.
 */
struct SandboxConfig {
    std::vector<std::string> worker_command = {"quill_check_worker"};
    std::vector<std::string> checker_command = {
        "tsc", "--noEmit", "--pretty", "false", "--incremental",
        "--tsBuildInfoFile", "{tsbuildinfo}", "-p", "{overlay}"
    };
    std::chrono::milliseconds timeout = std::chrono::seconds(60);

    Expected<void> validate() const {
        if (worker_command.empty() || worker_command.front().empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "worker_command cannot be empty"});
        }
        if (checker_command.empty() || checker_command.front().empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "checker_command cannot be empty"});
        }
        if (timeout.count() <= 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Sandbox timeout must be positive"});
        }
        return {};
    }
};

} // namespace quill
