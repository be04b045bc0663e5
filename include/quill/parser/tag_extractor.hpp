#pragma once

#include "../types.hpp"
#include "../log.hpp"
#include "path_utils.hpp"
#include <algorithm>
#include <cctype>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quill {
namespace parser {

// ============================================================================
// Tag names
// ============================================================================

namespace tags {
inline constexpr const char* Write = "write";
inline constexpr const char* Rename = "rename";
inline constexpr const char* Delete = "delete";
inline constexpr const char* AddDependency = "add-dependency";
inline constexpr const char* ChatSummary = "chat-summary";
inline constexpr const char* ExecuteSql = "execute-sql";
inline constexpr const char* Command = "command";
inline constexpr const char* SearchReplace = "search-replace";
inline constexpr const char* Output = "quill-output";

/// Every tag the extractor understands, in emission order.
inline const std::vector<std::string_view>& all() {
    static const std::vector<std::string_view> names = {
        Write, Rename, Delete, AddDependency, ChatSummary, ExecuteSql, Command, SearchReplace
    };
    return names;
}
} // namespace tags

namespace detail {

inline std::string trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return text.substr(begin, end - begin);
}

inline std::string to_lower(const std::string& text) {
    std::string out = text;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

/**
 * @brief Position of the '>' closing an opening tag, skipping quoted values.
 *
 * A quoted value never spans a line or contains "</". If a quote is still
 * open at either point, or at the end of the text, the tag ends at the first
 * raw '>' after `start` and `balanced` is set to false.
 */
inline size_t find_open_tag_end(const std::string& text, size_t start, bool& balanced) {
    balanced = true;
    bool in_quotes = false;
    for (size_t i = start; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '"') {
            in_quotes = !in_quotes;
        } else if (in_quotes && (c == '\n' || (c == '<' && i + 1 < text.size() && text[i + 1] == '/'))) {
            break;
        } else if (c == '>' && !in_quotes) {
            return i;
        }
    }
    if (!in_quotes) return std::string::npos;
    balanced = false;
    return text.find('>', start);
}
} // namespace detail

/** @brief Actions found in a response plus non-fatal extraction warnings. */
struct ExtractionResult {
    std::vector<Action> actions;
    std::vector<std::string> warnings;
};

// ============================================================================
// TagExtractor
// ============================================================================

/**
 * @brief Extracts typed actions from the tag markup embedded in model output.
 *
 * Each tag kind is scanned independently over the whole text, so the returned
 * list is grouped by kind (in tags::all() order) and keeps textual order
 * within a kind. Extraction never fails: malformed tags are skipped, and
 * path-bearing tags that lack a usable path are reported in `warnings`.
 *
 * @threadsafety Stateless; safe to call concurrently.
 */
class TagExtractor {
public:
    static ExtractionResult extract(const std::string& text) {
        ExtractionResult result;
        const std::string lowered = detail::to_lower(text);

        for (const auto& raw : scan(text, lowered, tags::Write, result.warnings)) {
            auto path = required_path(raw, "path", tags::Write, result.warnings);
            if (!path) continue;
            result.actions.push_back(WriteAction{*path, clean_body(raw.body), optional_attr(raw, "description")});
        }

        for (const auto& raw : scan(text, lowered, tags::Rename, result.warnings)) {
            auto from = required_path(raw, "from", tags::Rename, result.warnings);
            if (!from) continue;
            auto to = required_path(raw, "to", tags::Rename, result.warnings);
            if (!to) continue;
            result.actions.push_back(RenameAction{*from, *to});
        }

        for (const auto& raw : scan(text, lowered, tags::Delete, result.warnings)) {
            auto path = required_path(raw, "path", tags::Delete, result.warnings);
            if (!path) continue;
            result.actions.push_back(DeleteAction{*path});
        }

        for (const auto& raw : scan(text, lowered, tags::AddDependency, result.warnings)) {
            auto packages = optional_attr(raw, "packages");
            if (!packages) {
                logger()->debug("Skipping <{}> tag without packages: {}", tags::AddDependency, preview(raw.source));
                continue;
            }
            auto names = split_whitespace(*packages);
            if (names.empty()) continue;
            result.actions.push_back(AddDependencyAction{std::move(names)});
        }

        for (const auto& raw : scan(text, lowered, tags::ChatSummary, result.warnings)) {
            auto summary = detail::trim(raw.body);
            if (summary.empty()) continue;
            result.actions.push_back(ChatSummaryAction{std::move(summary)});
        }

        for (const auto& raw : scan(text, lowered, tags::ExecuteSql, result.warnings)) {
            result.actions.push_back(ExecuteSqlAction{clean_body(raw.body), optional_attr(raw, "description")});
        }

        for (const auto& raw : scan(text, lowered, tags::Command, result.warnings)) {
            auto type = optional_attr(raw, "type");
            if (!type) {
                logger()->debug("Skipping <{}> tag without type: {}", tags::Command, preview(raw.source));
                continue;
            }
            result.actions.push_back(CommandAction{*type});
        }

        for (const auto& raw : scan(text, lowered, tags::SearchReplace, result.warnings)) {
            auto path = required_path(raw, "path", tags::SearchReplace, result.warnings);
            if (!path) continue;
            result.actions.push_back(SearchReplaceAction{*path, clean_body(raw.body), optional_attr(raw, "description")});
        }

        return result;
    }

    /**
     * @brief Strip markdown fences from a tag body.
     *
     * The body is trimmed; a first line starting with ``` and a last line
     * starting with ``` are removed. Inner lines, blank ones included, are
     * kept verbatim.
     */
    static std::string clean_body(const std::string& body) {
        std::string trimmed = detail::trim(body);

        std::vector<std::string> lines;
        size_t pos = 0;
        while (true) {
            size_t nl = trimmed.find('\n', pos);
            if (nl == std::string::npos) {
                lines.push_back(trimmed.substr(pos));
                break;
            }
            lines.push_back(trimmed.substr(pos, nl - pos));
            pos = nl + 1;
        }

        if (!lines.empty() && is_fence(lines.front())) {
            lines.erase(lines.begin());
        }
        if (!lines.empty() && is_fence(lines.back())) {
            lines.pop_back();
        }

        std::string out;
        for (size_t i = 0; i < lines.size(); ++i) {
            if (i > 0) out += '\n';
            out += lines[i];
        }
        return out;
    }

private:
    struct RawTag {
        std::map<std::string, std::string> attributes;
        std::string body;
        std::string source;   ///< Opening tag text, for diagnostics
    };

    static std::shared_ptr<spdlog::logger> logger() {
        return log::get("quill.extractor");
    }

    /**
     * @brief Find all non-overlapping occurrences of one tag kind.
     *
     * `lowered` is the lower-cased text, used for case-insensitive matching
     * of tag names; offsets are shared with `text`. An unterminated opening
     * tag or one with an unbalanced quote is reported in `warnings`, and
     * scanning resumes after it.
     */
    static std::vector<RawTag> scan(const std::string& text, const std::string& lowered, std::string_view name,
                                    std::vector<std::string>& warnings) {
        std::vector<RawTag> found;
        const std::string open = "<" + std::string(name);
        const std::string close = "</" + std::string(name) + ">";

        size_t pos = 0;
        while ((pos = lowered.find(open, pos)) != std::string::npos) {
            size_t after_name = pos + open.size();
            if (after_name >= text.size()) break;

            char next = text[after_name];
            if (!(std::isspace(static_cast<unsigned char>(next)) || next == '>' || next == '/')) {
                pos = after_name;
                continue;
            }

            bool balanced = true;
            size_t tag_end = detail::find_open_tag_end(text, after_name, balanced);
            if (tag_end == std::string::npos) {
                logger()->warn("Unterminated <{}> opening tag at offset {}", name, pos);
                warnings.push_back("Found unterminated <" + std::string(name) + "> tag: " + preview(text.substr(pos)));
                pos = after_name;
                continue;
            }
            if (!balanced) {
                logger()->warn("Unbalanced quote in <{}> tag at offset {}", name, pos);
                warnings.push_back("Found <" + std::string(name) + "> tag with an unbalanced quote: " +
                                   preview(text.substr(pos, tag_end + 1 - pos)));
            }

            RawTag raw;
            raw.source = text.substr(pos, tag_end + 1 - pos);
            std::string attr_text = text.substr(after_name, tag_end - after_name);
            bool self_closing = !attr_text.empty() && attr_text.back() == '/';
            if (self_closing) attr_text.pop_back();
            raw.attributes = parse_attributes(attr_text);

            if (self_closing) {
                found.push_back(std::move(raw));
                pos = tag_end + 1;
                continue;
            }

            size_t close_pos = lowered.find(close, tag_end + 1);
            if (close_pos == std::string::npos) {
                logger()->debug("No closing tag for <{}> at offset {}", name, pos);
                pos = tag_end + 1;
                continue;
            }

            raw.body = text.substr(tag_end + 1, close_pos - tag_end - 1);
            found.push_back(std::move(raw));
            pos = close_pos + close.size();
        }

        return found;
    }

    /// Parse `name="value"` pairs; unquoted or malformed fragments are skipped.
    static std::map<std::string, std::string> parse_attributes(const std::string& text) {
        std::map<std::string, std::string> attrs;
        size_t i = 0;
        const size_t n = text.size();

        auto is_name_char = [](char c) {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == ':';
        };

        while (i < n) {
            while (i < n && std::isspace(static_cast<unsigned char>(text[i]))) ++i;
            size_t name_start = i;
            while (i < n && is_name_char(text[i])) ++i;
            if (i == name_start) {
                ++i;  // stray character
                continue;
            }
            std::string name = detail::to_lower(text.substr(name_start, i - name_start));

            while (i < n && std::isspace(static_cast<unsigned char>(text[i]))) ++i;
            if (i >= n || text[i] != '=') continue;
            ++i;
            while (i < n && std::isspace(static_cast<unsigned char>(text[i]))) ++i;
            if (i >= n || text[i] != '"') {
                while (i < n && !std::isspace(static_cast<unsigned char>(text[i]))) ++i;
                continue;
            }
            ++i;
            size_t value_end = text.find('"', i);
            if (value_end == std::string::npos) break;

            attrs.emplace(std::move(name), text.substr(i, value_end - i));
            i = value_end + 1;
        }
        return attrs;
    }

    static std::optional<std::string> optional_attr(const RawTag& raw, const std::string& name) {
        auto it = raw.attributes.find(name);
        if (it == raw.attributes.end() || it->second.empty()) {
            return std::nullopt;
        }
        return it->second;
    }

    /// Required, normalized path attribute. Records one warning on failure.
    static std::optional<std::string> required_path(
        const RawTag& raw,
        const std::string& attr,
        std::string_view tag,
        std::vector<std::string>& warnings
    ) {
        auto value = optional_attr(raw, attr);
        if (!value) {
            std::string warning = "Found <" + std::string(tag) + "> tag without a valid '" + attr +
                                  "' attribute: " + preview(raw.source);
            logger()->warn("{}", warning);
            warnings.push_back(std::move(warning));
            return std::nullopt;
        }

        auto normalized = normalize_path(*value);
        if (!normalized) {
            std::string warning = "Found <" + std::string(tag) + "> tag with an unusable '" + attr +
                                  "' attribute \"" + *value + "\"";
            logger()->warn("{}", warning);
            warnings.push_back(std::move(warning));
            return std::nullopt;
        }
        return normalized;
    }

    static bool is_fence(const std::string& line) {
        size_t i = 0;
        while (i < line.size() && (line[i] == ' ' || line[i] == '\t')) ++i;
        return line.compare(i, 3, "```") == 0;
    }

    static std::vector<std::string> split_whitespace(const std::string& text) {
        std::vector<std::string> parts;
        std::string current;
        for (char c : text) {
            if (std::isspace(static_cast<unsigned char>(c))) {
                if (!current.empty()) {
                    parts.push_back(std::move(current));
                    current.clear();
                }
            } else {
                current.push_back(c);
            }
        }
        if (!current.empty()) parts.push_back(std::move(current));
        return parts;
    }

    static std::string preview(const std::string& text) {
        constexpr size_t kMaxPreview = 120;
        if (text.size() <= kMaxPreview) return text;
        return text.substr(0, kMaxPreview) + "...";
    }
};

// ============================================================================
// Markup helpers
// ============================================================================

/**
 * @brief Escape '<' and '>' inside the attribute section of Quill tags.
 *
 * Models regularly write descriptions such as `description="use <a> tags"`.
 * Inside the opening tag of a Quill tag, angle brackets are replaced by the
 * full-width forms U+FF1C and U+FF1E. Tag bodies and all other markup are
 * left untouched.
 */
inline std::string sanitize_tag_attributes(const std::string& text) {
    const std::string lowered = detail::to_lower(text);
    std::string out;
    out.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        size_t lt = text.find('<', pos);
        if (lt == std::string::npos) {
            out.append(text, pos, std::string::npos);
            break;
        }
        out.append(text, pos, lt - pos);

        size_t name_end = std::string::npos;
        for (auto name : tags::all()) {
            if (lowered.compare(lt + 1, name.size(), name) == 0) {
                size_t after = lt + 1 + name.size();
                if (after < text.size() &&
                    (std::isspace(static_cast<unsigned char>(text[after])) || text[after] == '>' || text[after] == '/')) {
                    name_end = after;
                    break;
                }
            }
        }

        if (name_end == std::string::npos) {
            out.push_back('<');
            pos = lt + 1;
            continue;
        }

        bool balanced = true;
        size_t tag_end = detail::find_open_tag_end(text, name_end, balanced);
        if (tag_end == std::string::npos || !balanced) {
            // Quote parity cannot be trusted; copy up to the first raw '>'.
            size_t end = tag_end == std::string::npos ? text.size() : tag_end + 1;
            out.append(text, lt, end - lt);
            pos = end;
            continue;
        }

        out.append(text, lt, name_end - lt);
        bool in_quotes = false;
        for (size_t i = name_end; i <= tag_end; ++i) {
            char c = text[i];
            if (c == '"') {
                in_quotes = !in_quotes;
                out.push_back(c);
            } else if (in_quotes && c == '<') {
                out += "\xEF\xBC\x9C";  // ＜
            } else if (in_quotes && c == '>') {
                out += "\xEF\xBC\x9E";  // ＞
            } else {
                out.push_back(c);
            }
        }
        pos = tag_end + 1;
    }
    return out;
}

namespace detail {

inline std::string description_attr(const std::optional<std::string>& description) {
    return description ? " description=\"" + *description + "\"" : std::string();
}

struct MarkupWriter {
    std::string operator()(const WriteAction& a) const {
        return "<write path=\"" + a.path + "\"" + description_attr(a.description) + ">\n" +
               a.content + "\n</write>";
    }
    std::string operator()(const RenameAction& a) const {
        return "<rename from=\"" + a.from + "\" to=\"" + a.to + "\"></rename>";
    }
    std::string operator()(const DeleteAction& a) const {
        return "<delete path=\"" + a.path + "\"></delete>";
    }
    std::string operator()(const AddDependencyAction& a) const {
        std::string joined;
        for (size_t i = 0; i < a.packages.size(); ++i) {
            if (i > 0) joined += ' ';
            joined += a.packages[i];
        }
        return "<add-dependency packages=\"" + joined + "\"></add-dependency>";
    }
    std::string operator()(const ExecuteSqlAction& a) const {
        return "<execute-sql" + description_attr(a.description) + ">\n" + a.statement + "\n</execute-sql>";
    }
    std::string operator()(const SearchReplaceAction& a) const {
        return "<search-replace path=\"" + a.path + "\"" + description_attr(a.description) + ">\n" +
               a.rules + "\n</search-replace>";
    }
    std::string operator()(const ChatSummaryAction& a) const {
        return "<chat-summary>" + a.text + "</chat-summary>";
    }
    std::string operator()(const CommandAction& a) const {
        return "<command type=\"" + a.type + "\"></command>";
    }
};

} // namespace detail

/// Render an action back to its tag form.
inline std::string to_markup(const Action& action) {
    return std::visit(detail::MarkupWriter{}, action);
}

/// Text of the first chat-summary action, if any.
inline std::optional<std::string> find_chat_summary(const std::vector<Action>& actions) {
    for (const auto& action : actions) {
        if (const auto* summary = std::get_if<ChatSummaryAction>(&action)) {
            return summary->text;
        }
    }
    return std::nullopt;
}

} // namespace parser
} // namespace quill
