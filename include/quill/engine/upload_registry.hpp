#pragma once

#include "../types.hpp"
#include <mutex>
#include <string>
#include <unordered_map>

namespace quill {
namespace engine {

/** @brief A file the user attached to a conversation, awaiting substitution. */
struct PendingUpload {
    std::string file_path;      ///< Where the uploaded bytes live on disk
    std::string original_name;  ///< Name shown to the user
};

using UploadMap = std::unordered_map<std::string, PendingUpload>;

/**
 * @brief Per-conversation registry of pending uploads keyed by upload id.
 *
 * When a write tag's trimmed body equals a registered upload id, the
 * orchestrator writes the uploaded file instead of the tag body. Entries are
 * consumed with take() at the start of each invocation so a later turn can
 * never substitute a stale upload.
 *
 * @threadsafety All methods are thread-safe.
 */
class UploadRegistry {
public:
    void add(ConversationId conversation, std::string upload_id, PendingUpload upload) {
        std::lock_guard<std::mutex> lock(mutex_);
        uploads_[conversation][std::move(upload_id)] = std::move(upload);
    }

    /// Remove and return every pending upload for a conversation.
    UploadMap take(ConversationId conversation) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = uploads_.find(conversation);
        if (it == uploads_.end()) {
            return {};
        }
        UploadMap taken = std::move(it->second);
        uploads_.erase(it);
        return taken;
    }

    void clear(ConversationId conversation) {
        std::lock_guard<std::mutex> lock(mutex_);
        uploads_.erase(conversation);
    }

    size_t pending_count(ConversationId conversation) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = uploads_.find(conversation);
        return it == uploads_.end() ? 0 : it->second.size();
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<ConversationId, UploadMap> uploads_;
};

} // namespace engine
} // namespace quill
