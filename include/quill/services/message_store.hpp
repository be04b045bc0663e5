#pragma once

#include "../types.hpp"
#include <optional>
#include <string>

namespace quill {
namespace services {

enum class Role {
    User,
    Assistant,
    System
};

[[nodiscard]] inline const char* role_to_string(Role role) {
    switch (role) {
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
        case Role::System: return "system";
    }
    return "unknown";
}

[[nodiscard]] inline std::optional<Role> role_from_string(const std::string& text) {
    if (text == "user") return Role::User;
    if (text == "assistant") return Role::Assistant;
    if (text == "system") return Role::System;
    return std::nullopt;
}

/// Review state of an assistant message whose actions were proposed.
enum class ApprovalState {
    Pending,
    Approved,
    Rejected
};

[[nodiscard]] inline const char* approval_to_string(ApprovalState state) {
    switch (state) {
        case ApprovalState::Pending: return "pending";
        case ApprovalState::Approved: return "approved";
        case ApprovalState::Rejected: return "rejected";
    }
    return "unknown";
}

[[nodiscard]] inline std::optional<ApprovalState> approval_from_string(const std::string& text) {
    if (text == "pending") return ApprovalState::Pending;
    if (text == "approved") return ApprovalState::Approved;
    if (text == "rejected") return ApprovalState::Rejected;
    return std::nullopt;
}

struct MessageRecord {
    MessageId id = 0;
    ConversationId conversation_id = 0;
    Role role = Role::Assistant;
    std::string content;
    std::optional<ApprovalState> approval;
    std::optional<std::string> commit_id;

    bool operator==(const MessageRecord& other) const {
        return id == other.id &&
               conversation_id == other.conversation_id &&
               role == other.role &&
               content == other.content &&
               approval == other.approval &&
               commit_id == other.commit_id;
    }
    bool operator!=(const MessageRecord& other) const { return !(*this == other); }
};

/**
 * @brief A project: a directory on disk, optionally linked to a remote database.
 */
struct ProjectRecord {
    ProjectId id = 0;
    std::string root_path;
    std::optional<std::string> linked_database_project_id;  ///< Remote database project, if any
    std::optional<std::string> database_branch_id;          ///< Branch to snapshot before changes

    bool operator==(const ProjectRecord& other) const {
        return id == other.id &&
               root_path == other.root_path &&
               linked_database_project_id == other.linked_database_project_id &&
               database_branch_id == other.database_branch_id;
    }
    bool operator!=(const ProjectRecord& other) const { return !(*this == other); }
};

/**
 * @brief Persistence boundary for projects and chat messages.
 *
 * Lookups return an empty optional for "not found"; the error channel is
 * reserved for storage failures.
 */
class IMessageStore {
public:
    virtual ~IMessageStore() = default;

    virtual Expected<std::optional<MessageRecord>> find_message(
        MessageId id, Role role, ConversationId conversation_id) = 0;

    virtual Expected<std::optional<ProjectRecord>> find_project_for_conversation(
        ConversationId conversation_id) = 0;

    virtual Expected<void> update_content(MessageId id, const std::string& content) = 0;

    virtual Expected<void> set_approval(MessageId id, ApprovalState state) = 0;

    virtual Expected<void> set_commit_id(MessageId id, const std::string& commit_id) = 0;
};

} // namespace services
} // namespace quill
