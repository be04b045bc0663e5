#pragma once

#include "message_store.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <sqlite3.h>
#include <string>

namespace quill {
namespace services {

/**
 * @brief SQLite-backed project, conversation and message store.
 *
 * Schema:
 * - projects(id, root_path, database_project_id, database_branch_id)
 * - conversations(id, project_id)
 * - messages(id, conversation_id, role, content, approval_state, commit_hash)
 *
 * @threadsafety All methods are serialized by an internal mutex.
 */
class SqliteStore : public IMessageStore {
public:
    ~SqliteStore() override {
        if (db_ != nullptr) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    /// Open (or create) a store. Pass ":memory:" for a private in-memory database.
    static Expected<std::shared_ptr<SqliteStore>> open(const std::string& path) {
        if (path.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Store path cannot be empty"});
        }

        sqlite3* db = nullptr;
        if (sqlite3_open(path.c_str(), &db) != SQLITE_OK) {
            std::string message = "Failed to open store";
            if (db != nullptr && sqlite3_errmsg(db) != nullptr) {
                message += std::string(": ") + sqlite3_errmsg(db);
            }
            if (db != nullptr) {
                sqlite3_close(db);
            }
            return tl::unexpected(Error{ErrorCode::StoreFailed, std::move(message), path});
        }

        auto instance = std::shared_ptr<SqliteStore>(new SqliteStore(db, path));
        auto init_result = instance->initialize_schema();
        if (!init_result) {
            return tl::unexpected(init_result.error());
        }
        return instance;
    }

    // ========================================================================
    // Record creation
    // ========================================================================

    Expected<ProjectId> add_project(
        const std::string& root_path,
        std::optional<std::string> database_project_id = std::nullopt,
        std::optional<std::string> database_branch_id = std::nullopt
    ) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto stmt = prepare(
            "INSERT INTO projects(root_path, database_project_id, database_branch_id) VALUES (?1, ?2, ?3)");
        if (!stmt) {
            return tl::unexpected(stmt.error());
        }
        sqlite3_bind_text(stmt->get(), 1, root_path.c_str(), -1, SQLITE_TRANSIENT);
        bind_optional(stmt->get(), 2, database_project_id);
        bind_optional(stmt->get(), 3, database_branch_id);
        if (sqlite3_step(stmt->get()) != SQLITE_DONE) {
            return tl::unexpected(make_sql_error("Failed to insert project"));
        }
        return static_cast<ProjectId>(sqlite3_last_insert_rowid(db_));
    }

    Expected<ConversationId> add_conversation(ProjectId project_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto stmt = prepare("INSERT INTO conversations(project_id) VALUES (?1)");
        if (!stmt) {
            return tl::unexpected(stmt.error());
        }
        sqlite3_bind_int64(stmt->get(), 1, project_id);
        if (sqlite3_step(stmt->get()) != SQLITE_DONE) {
            return tl::unexpected(make_sql_error("Failed to insert conversation"));
        }
        return static_cast<ConversationId>(sqlite3_last_insert_rowid(db_));
    }

    Expected<MessageId> add_message(ConversationId conversation_id, Role role, const std::string& content) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto stmt = prepare("INSERT INTO messages(conversation_id, role, content) VALUES (?1, ?2, ?3)");
        if (!stmt) {
            return tl::unexpected(stmt.error());
        }
        sqlite3_bind_int64(stmt->get(), 1, conversation_id);
        sqlite3_bind_text(stmt->get(), 2, role_to_string(role), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt->get(), 3, content.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(stmt->get()) != SQLITE_DONE) {
            return tl::unexpected(make_sql_error("Failed to insert message"));
        }
        return static_cast<MessageId>(sqlite3_last_insert_rowid(db_));
    }

    // ========================================================================
    // IMessageStore
    // ========================================================================

    Expected<std::optional<MessageRecord>> find_message(
        MessageId id, Role role, ConversationId conversation_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto stmt = prepare(
            "SELECT id, conversation_id, role, content, approval_state, commit_hash FROM messages "
            "WHERE id = ?1 AND role = ?2 AND conversation_id = ?3");
        if (!stmt) {
            return tl::unexpected(stmt.error());
        }
        sqlite3_bind_int64(stmt->get(), 1, id);
        sqlite3_bind_text(stmt->get(), 2, role_to_string(role), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt->get(), 3, conversation_id);

        const int rc = sqlite3_step(stmt->get());
        if (rc == SQLITE_DONE) {
            return std::optional<MessageRecord>{};
        }
        if (rc != SQLITE_ROW) {
            return tl::unexpected(make_sql_error("Failed to read message"));
        }

        MessageRecord record;
        record.id = sqlite3_column_int64(stmt->get(), 0);
        record.conversation_id = sqlite3_column_int64(stmt->get(), 1);
        record.role = role_from_string(column_text(stmt->get(), 2).value_or("")).value_or(role);
        record.content = column_text(stmt->get(), 3).value_or("");
        if (auto approval = column_text(stmt->get(), 4)) {
            record.approval = approval_from_string(*approval);
        }
        record.commit_id = column_text(stmt->get(), 5);
        return std::optional<MessageRecord>{std::move(record)};
    }

    Expected<std::optional<ProjectRecord>> find_project_for_conversation(ConversationId conversation_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto stmt = prepare(
            "SELECT p.id, p.root_path, p.database_project_id, p.database_branch_id "
            "FROM conversations c JOIN projects p ON p.id = c.project_id WHERE c.id = ?1");
        if (!stmt) {
            return tl::unexpected(stmt.error());
        }
        sqlite3_bind_int64(stmt->get(), 1, conversation_id);

        const int rc = sqlite3_step(stmt->get());
        if (rc == SQLITE_DONE) {
            return std::optional<ProjectRecord>{};
        }
        if (rc != SQLITE_ROW) {
            return tl::unexpected(make_sql_error("Failed to read project"));
        }

        ProjectRecord record;
        record.id = sqlite3_column_int64(stmt->get(), 0);
        record.root_path = column_text(stmt->get(), 1).value_or("");
        record.linked_database_project_id = column_text(stmt->get(), 2);
        record.database_branch_id = column_text(stmt->get(), 3);
        return std::optional<ProjectRecord>{std::move(record)};
    }

    Expected<void> update_content(MessageId id, const std::string& content) override {
        return update_text("UPDATE messages SET content = ?1 WHERE id = ?2", id, content);
    }

    Expected<void> set_approval(MessageId id, ApprovalState state) override {
        return update_text("UPDATE messages SET approval_state = ?1 WHERE id = ?2", id, approval_to_string(state));
    }

    Expected<void> set_commit_id(MessageId id, const std::string& commit_id) override {
        return update_text("UPDATE messages SET commit_hash = ?1 WHERE id = ?2", id, commit_id);
    }

private:
    using StatementPtr = std::unique_ptr<sqlite3_stmt, int (*)(sqlite3_stmt*)>;

    SqliteStore(sqlite3* db, std::string db_path)
        : db_(db)
        , db_path_(std::move(db_path))
    {}

    Expected<void> initialize_schema() {
        char* err_msg = nullptr;
        constexpr const char* schema =
            "CREATE TABLE IF NOT EXISTS projects("
            "id INTEGER PRIMARY KEY AUTOINCREMENT,"
            "root_path TEXT NOT NULL,"
            "database_project_id TEXT,"
            "database_branch_id TEXT"
            ");"
            "CREATE TABLE IF NOT EXISTS conversations("
            "id INTEGER PRIMARY KEY AUTOINCREMENT,"
            "project_id INTEGER NOT NULL REFERENCES projects(id) ON DELETE CASCADE"
            ");"
            "CREATE TABLE IF NOT EXISTS messages("
            "id INTEGER PRIMARY KEY AUTOINCREMENT,"
            "conversation_id INTEGER NOT NULL REFERENCES conversations(id) ON DELETE CASCADE,"
            "role TEXT NOT NULL,"
            "content TEXT NOT NULL,"
            "approval_state TEXT,"
            "commit_hash TEXT"
            ");";
        if (sqlite3_exec(db_, schema, nullptr, nullptr, &err_msg) != SQLITE_OK) {
            std::string message = err_msg != nullptr ? err_msg : "Unknown SQLite error";
            sqlite3_free(err_msg);
            return tl::unexpected(Error{ErrorCode::StoreFailed, std::move(message), db_path_});
        }
        return {};
    }

    Expected<StatementPtr> prepare(const char* sql) const {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return tl::unexpected(make_sql_error("Failed to prepare statement"));
        }
        return StatementPtr(stmt, &sqlite3_finalize);
    }

    Expected<void> update_text(const char* sql, MessageId id, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto stmt = prepare(sql);
        if (!stmt) {
            return tl::unexpected(stmt.error());
        }
        sqlite3_bind_text(stmt->get(), 1, value.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt->get(), 2, id);
        if (sqlite3_step(stmt->get()) != SQLITE_DONE) {
            return tl::unexpected(make_sql_error("Failed to update message"));
        }
        if (sqlite3_changes(db_) == 0) {
            return tl::unexpected(Error{ErrorCode::MessageNotFound,
                                        "No message with id " + std::to_string(id), db_path_});
        }
        return {};
    }

    static void bind_optional(sqlite3_stmt* stmt, int index, const std::optional<std::string>& value) {
        if (value.has_value()) {
            sqlite3_bind_text(stmt, index, value->c_str(), -1, SQLITE_TRANSIENT);
        } else {
            sqlite3_bind_null(stmt, index);
        }
    }

    static std::optional<std::string> column_text(sqlite3_stmt* stmt, int index) {
        const unsigned char* raw = sqlite3_column_text(stmt, index);
        if (raw == nullptr) {
            return std::nullopt;
        }
        return std::string(reinterpret_cast<const char*>(raw));
    }

    Error make_sql_error(const std::string& prefix) const {
        return Error{
            ErrorCode::StoreFailed,
            prefix + ": " + sqlite3_errmsg(db_),
            db_path_
        };
    }

    sqlite3* db_ = nullptr;
    std::string db_path_;
    mutable std::mutex mutex_;
};

} // namespace services
} // namespace quill
