#pragma once

#include "../types.hpp"
#include <cctype>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace quill {
namespace parser {

/**
 * @brief Normalize a model-supplied project path.
 *
 * Converts backslashes to forward slashes, drops empty and "." segments and
 * folds ".." segments. Paths that are absolute, carry a drive letter, are
 * empty after normalization, or climb above the project root are rejected.
 *
 * @param raw Path exactly as it appeared in the markup
 * @return Normalized relative path, or std::nullopt if the path is unusable
 */
inline std::optional<std::string> normalize_path(const std::string& raw) {
    std::string path = raw;
    for (auto& c : path) {
        if (c == '\\') c = '/';
    }

    size_t begin = 0;
    size_t end = path.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(path[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(path[end - 1]))) --end;
    path = path.substr(begin, end - begin);

    if (path.empty() || path.front() == '/') {
        return std::nullopt;
    }
    if (path.size() >= 2 && path[1] == ':' && std::isalpha(static_cast<unsigned char>(path[0]))) {
        return std::nullopt;
    }

    std::vector<std::string> segments;
    size_t pos = 0;
    while (pos <= path.size()) {
        size_t slash = path.find('/', pos);
        if (slash == std::string::npos) slash = path.size();
        std::string segment = path.substr(pos, slash - pos);
        pos = slash + 1;

        if (segment.empty() || segment == ".") {
            continue;
        }
        if (segment == "..") {
            if (segments.empty()) {
                return std::nullopt;
            }
            segments.pop_back();
            continue;
        }
        segments.push_back(std::move(segment));
    }

    if (segments.empty()) {
        return std::nullopt;
    }

    std::string result;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) result += '/';
        result += segments[i];
    }
    return result;
}

/**
 * @brief Join a project-relative path onto the project root.
 *
 * Refuses any result that would resolve lexically outside the root.
 */
inline Expected<std::filesystem::path> safe_join(
    const std::filesystem::path& root,
    const std::string& relative
) {
    auto normalized = normalize_path(relative);
    if (!normalized) {
        return tl::unexpected(Error{
            ErrorCode::InvalidPath,
            "Path escapes the project root or is empty",
            relative
        });
    }

    const auto base = root.lexically_normal();
    auto joined = (base / *normalized).lexically_normal();
    auto rel = joined.lexically_relative(base);
    if (rel.empty() || *rel.begin() == "..") {
        return tl::unexpected(Error{
            ErrorCode::InvalidPath,
            "Path escapes the project root",
            relative
        });
    }
    return joined;
}

/// True when `path` names a deployable unit under `functions_dir`.
inline bool is_server_function(const std::string& path, const std::string& functions_dir) {
    if (functions_dir.empty()) return false;
    std::string prefix = functions_dir;
    if (prefix.back() != '/') prefix += '/';
    return path.compare(0, prefix.size(), prefix) == 0 && path.size() > prefix.size();
}

/**
 * @brief Remote function name for a deployable path.
 *
 * A path without an extension is taken as the function directory itself;
 * otherwise the function is named after the file's parent directory. The
 * extension check keeps this usable for paths that no longer exist on disk.
 */
inline std::string function_name_from_path(const std::string& path) {
    std::filesystem::path p(path);
    if (p.has_extension()) {
        return p.parent_path().filename().string();
    }
    return p.filename().string();
}

} // namespace parser
} // namespace quill
