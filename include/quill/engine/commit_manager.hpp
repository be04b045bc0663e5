#pragma once

#include "../types.hpp"
#include "../log.hpp"
#include "../services/version_control.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace quill {
namespace engine {

/**
 * @brief Everything one pipeline run changed, as the commit manager sees it.
 */
struct ChangeSet {
    std::vector<std::string> written;
    std::vector<RenamedPath> renamed;
    std::vector<std::string> deleted;
    std::vector<std::string> packages;
    size_t sql_count = 0;

    bool has_changes() const {
        return !written.empty() || !renamed.empty() || !deleted.empty() || !packages.empty();
    }
};

struct CommitOutcome {
    std::string commit_id;
    std::vector<std::string> out_of_band_files;   ///< Files folded in by the amend, if any
    std::optional<std::string> out_of_band_error; ///< Amend failure; the first commit still stands
};

/**
 * @brief Stages and commits the changes of one pipeline run.
 *
 * After its own commit it looks for files changed outside the pipeline and,
 * if there are any, amends them into the same commit.
 */
class CommitManager {
public:
    static constexpr const char* kOutOfBandNote = " + extra files edited outside of Quill";

    CommitManager(std::shared_ptr<services::IVersionControl> vcs, std::string product_marker)
        : vcs_(std::move(vcs))
        , product_marker_(std::move(product_marker)) {}

    /**
     * @brief Compose the commit message.
     *
     * `<marker> <summary> - <changes>` with a summary, `<marker> <changes>`
     * without. Changes are listed in pipeline order.
     */
    static std::string compose_message(
        const std::string& product_marker,
        const ChangeSet& changes,
        const std::optional<std::string>& summary
    ) {
        std::vector<std::string> parts;
        if (changes.sql_count > 0) {
            parts.push_back("executed " + std::to_string(changes.sql_count) + " SQL queries");
        }
        if (!changes.packages.empty()) {
            parts.push_back("added " + join(changes.packages, ", ") + " package(s)");
        }
        if (!changes.deleted.empty()) {
            parts.push_back("deleted " + std::to_string(changes.deleted.size()) + " file(s)");
        }
        if (!changes.renamed.empty()) {
            parts.push_back("renamed " + std::to_string(changes.renamed.size()) + " file(s)");
        }
        if (!changes.written.empty()) {
            parts.push_back("wrote " + std::to_string(changes.written.size()) + " file(s)");
        }

        const std::string listed = join(parts, ", ");
        if (summary.has_value() && !summary->empty()) {
            return product_marker + " " + *summary + " - " + listed;
        }
        return product_marker + " " + listed;
    }

    /**
     * @brief Stage, commit and fold in out-of-band edits.
     *
     * Errors: failing to stage a written or renamed path, or the commit
     * itself, is returned. Failing to unstage a deleted path is only logged.
     * An amend failure is reported in CommitOutcome::out_of_band_error.
     */
    Expected<CommitOutcome> commit(
        const std::string& root,
        const ChangeSet& changes,
        const std::optional<std::string>& summary
    ) {
        auto logger = log::get("quill.commit");

        for (const auto& path : changes.deleted) {
            if (auto removed = vcs_->remove(root, path); !removed) {
                logger->warn("Failed to unstage deleted path {}: {}", path, removed.error().message);
            }
        }

        for (const auto& rename : changes.renamed) {
            if (auto added = vcs_->add(root, rename.to); !added) {
                return tl::unexpected(commit_error("Failed to stage renamed path " + rename.to, added.error()));
            }
            if (auto removed = vcs_->remove(root, rename.from); !removed) {
                logger->warn("Failed to unstage old path {}: {}", rename.from, removed.error().message);
            }
        }

        for (const auto& path : changes.written) {
            if (auto added = vcs_->add(root, path); !added) {
                return tl::unexpected(commit_error("Failed to stage " + path, added.error()));
            }
        }

        const std::string message = compose_message(product_marker_, changes, summary);
        auto commit_id = vcs_->commit(root, message, false);
        if (!commit_id) {
            return tl::unexpected(commit_error("Failed to commit changes", commit_id.error()));
        }
        logger->info("Committed {}: {}", *commit_id, message);

        CommitOutcome outcome;
        outcome.commit_id = *commit_id;

        auto uncommitted = vcs_->list_uncommitted(root);
        if (!uncommitted) {
            logger->warn("Could not list uncommitted files: {}", uncommitted.error().message);
            outcome.out_of_band_error = uncommitted.error().message;
            return outcome;
        }
        if (uncommitted->empty()) {
            return outcome;
        }

        outcome.out_of_band_files = *uncommitted;
        auto amended = vcs_->add_all(root).and_then([&]() {
            return vcs_->commit(root, message + kOutOfBandNote, true);
        });
        if (amended) {
            outcome.commit_id = *amended;
            logger->info("Amended commit with {} file(s) edited outside the pipeline", uncommitted->size());
        } else {
            logger->error("Failed to amend commit with out-of-band files: {}", amended.error().message);
            outcome.out_of_band_error = amended.error().message;
        }
        return outcome;
    }

private:
    static std::string join(const std::vector<std::string>& items, const std::string& separator) {
        std::string out;
        for (size_t i = 0; i < items.size(); ++i) {
            if (i > 0) out += separator;
            out += items[i];
        }
        return out;
    }

    static Error commit_error(const std::string& message, const Error& cause) {
        return Error{ErrorCode::CommitFailed, message + ": " + cause.message, cause.context};
    }

    std::shared_ptr<services::IVersionControl> vcs_;
    std::string product_marker_;
};

} // namespace engine
} // namespace quill
