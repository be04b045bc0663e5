#pragma once

#include "../types.hpp"
#include "../log.hpp"
#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace quill {
namespace sandbox {

/**
 * @brief Hypothetical file changes to type-check without touching the real tree.
 *
 * Applied in pipeline order: deletes, then renames, then writes.
 */
struct VirtualChanges {
    std::vector<WriteAction> writes;
    std::vector<RenameAction> renames;
    std::vector<std::string> deletes;

    static VirtualChanges from_actions(const std::vector<Action>& actions) {
        VirtualChanges changes;
        for (const auto& action : actions) {
            if (const auto* write = std::get_if<WriteAction>(&action)) {
                changes.writes.push_back(*write);
            } else if (const auto* rename = std::get_if<RenameAction>(&action)) {
                changes.renames.push_back(*rename);
            } else if (const auto* del = std::get_if<DeleteAction>(&action)) {
                changes.deletes.push_back(del->path);
            }
        }
        return changes;
    }

    bool empty() const {
        return writes.empty() && renames.empty() && deletes.empty();
    }
};

/**
 * @brief Materializes "real project + virtual changes" in a scratch directory.
 *
 * Project files are copied, never linked, so nothing done inside the overlay
 * can reach the real files. `node_modules` directories are linked as a whole
 * and `.git` is skipped. The overlay directory is wiped and rebuilt on each
 * call; its location is stable per project so incremental checker caches
 * stay valid between runs.
 */
class OverlayBuilder {
public:
    /// Stable, filesystem-safe key for a project root (FNV-1a of the canonical path).
    static std::string project_key(const std::filesystem::path& project_root) {
        std::error_code ec;
        auto canonical = std::filesystem::weakly_canonical(project_root, ec);
        const std::string text = ec ? project_root.lexically_normal().string() : canonical.string();

        uint64_t hash = 1469598103934665603ULL;
        for (unsigned char c : text) {
            hash ^= c;
            hash *= 1099511628211ULL;
        }
        char buf[17];
        std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(hash));

        std::string name = canonical.filename().string();
        if (name.empty()) name = "project";
        return name + "-" + buf;
    }

    static std::filesystem::path overlay_dir(const std::filesystem::path& cache_dir, const std::filesystem::path& project_root) {
        return cache_dir / project_key(project_root) / "overlay";
    }

    static std::filesystem::path build_info_path(const std::filesystem::path& cache_dir, const std::filesystem::path& project_root) {
        return cache_dir / project_key(project_root) / "tsconfig.tsbuildinfo";
    }

    /**
     * @brief Build the overlay.
     *
     * @return Number of files materialized in the overlay
     */
    static Expected<size_t> build(
        const std::filesystem::path& project_root,
        const std::filesystem::path& overlay_root,
        const VirtualChanges& changes
    ) {
        namespace fs = std::filesystem;
        std::error_code ec;

        if (!fs::is_directory(project_root, ec)) {
            return tl::unexpected(Error{ErrorCode::InvalidProjectRoot, "Project root is not a directory",
                                        project_root.string()});
        }
        const fs::path root = fs::canonical(project_root, ec);
        if (ec) {
            return tl::unexpected(Error{ErrorCode::InvalidProjectRoot, ec.message(), project_root.string()});
        }
        const fs::path overlay = fs::weakly_canonical(overlay_root, ec);
        if (ec || overlay.empty()) {
            return tl::unexpected(Error{ErrorCode::OverlayFailed, "Cannot resolve overlay directory",
                                        overlay_root.string()});
        }
        if (overlay == root || is_within(overlay, root)) {
            return tl::unexpected(Error{ErrorCode::OverlayFailed,
                                        "Overlay directory must not be the project root or contain it",
                                        overlay.string()});
        }

        FileMap files;
        std::vector<std::string> linked_dirs;
        if (auto collected = collect(root, overlay, files, linked_dirs); !collected) {
            return tl::unexpected(collected.error());
        }

        apply_changes(files, linked_dirs, changes);

        fs::remove_all(overlay, ec);
        if (ec) {
            return tl::unexpected(Error{ErrorCode::OverlayFailed, "Failed to clear overlay: " + ec.message(),
                                        overlay.string()});
        }
        fs::create_directories(overlay, ec);
        if (ec) {
            return tl::unexpected(Error{ErrorCode::OverlayFailed, "Failed to create overlay: " + ec.message(),
                                        overlay.string()});
        }

        for (const auto& rel : linked_dirs) {
            const fs::path target = overlay / rel;
            fs::create_directories(target.parent_path(), ec);
            fs::create_directory_symlink(root / rel, target, ec);
            if (ec) {
                logger()->warn("Could not link {} into overlay: {}", rel, ec.message());
                ec.clear();
            }
        }

        size_t count = 0;
        for (const auto& [rel, source] : files) {
            const fs::path target = overlay / rel;
            fs::create_directories(target.parent_path(), ec);
            if (ec) {
                return tl::unexpected(Error{ErrorCode::OverlayFailed, "Failed to create directory: " + ec.message(),
                                            target.parent_path().string()});
            }

            if (const auto* real = std::get_if<RealFile>(&source)) {
                fs::copy_file(real->path, target, fs::copy_options::overwrite_existing, ec);
                if (ec) {
                    return tl::unexpected(Error{ErrorCode::OverlayFailed, "Failed to copy file: " + ec.message(),
                                                real->path.string()});
                }
            } else {
                const auto& text = std::get<VirtualFile>(source).content;
                std::ofstream out(target, std::ios::binary | std::ios::trunc);
                out.write(text.data(), static_cast<std::streamsize>(text.size()));
                if (!out) {
                    return tl::unexpected(Error{ErrorCode::OverlayFailed, "Failed to write virtual file",
                                                target.string()});
                }
            }
            ++count;
        }

        logger()->debug("Overlay for {} built at {} ({} files)", root.string(), overlay.string(), count);
        return count;
    }

private:
    struct RealFile { std::filesystem::path path; };
    struct VirtualFile { std::string content; };
    using FileMap = std::map<std::string, std::variant<RealFile, VirtualFile>>;

    static std::shared_ptr<spdlog::logger> logger() {
        return log::get("quill.sandbox");
    }

    static bool is_within(const std::filesystem::path& parent, const std::filesystem::path& child) {
        auto rel = child.lexically_relative(parent);
        return !rel.empty() && *rel.begin() != "..";
    }

    static Expected<void> collect(
        const std::filesystem::path& root,
        const std::filesystem::path& overlay,
        FileMap& files,
        std::vector<std::string>& linked_dirs
    ) {
        namespace fs = std::filesystem;
        std::error_code ec;
        fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            return tl::unexpected(Error{ErrorCode::OverlayFailed, "Cannot read project: " + ec.message(),
                                        root.string()});
        }

        for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (ec) {
                return tl::unexpected(Error{ErrorCode::OverlayFailed, "Cannot read project: " + ec.message(),
                                            root.string()});
            }
            const fs::path& path = it->path();
            const std::string name = path.filename().string();

            if (it->is_directory(ec)) {
                if (name == ".git" || path == overlay) {
                    it.disable_recursion_pending();
                } else if (name == "node_modules") {
                    linked_dirs.push_back(path.lexically_relative(root).generic_string());
                    it.disable_recursion_pending();
                }
                continue;
            }
            if (it->is_regular_file(ec)) {
                files[path.lexically_relative(root).generic_string()] = RealFile{path};
            }
        }
        return {};
    }

    static bool under(const std::string& path, const std::string& dir) {
        return path == dir || (path.size() > dir.size() && path.compare(0, dir.size(), dir) == 0 && path[dir.size()] == '/');
    }

    static void apply_changes(FileMap& files, std::vector<std::string>& linked_dirs, const VirtualChanges& changes) {
        for (const auto& del : changes.deletes) {
            for (auto it = files.begin(); it != files.end();) {
                it = under(it->first, del) ? files.erase(it) : std::next(it);
            }
            linked_dirs.erase(std::remove_if(linked_dirs.begin(), linked_dirs.end(),
                                             [&](const std::string& d) { return under(d, del); }),
                              linked_dirs.end());
        }

        for (const auto& rename : changes.renames) {
            FileMap moved;
            for (auto it = files.begin(); it != files.end();) {
                if (under(it->first, rename.from)) {
                    std::string target = rename.to + it->first.substr(rename.from.size());
                    moved[target] = std::move(it->second);
                    it = files.erase(it);
                } else {
                    ++it;
                }
            }
            for (auto& [path, source] : moved) {
                files[path] = std::move(source);
            }
        }

        for (const auto& write : changes.writes) {
            files[write.path] = VirtualFile{write.content};
        }
    }
};

} // namespace sandbox
} // namespace quill
