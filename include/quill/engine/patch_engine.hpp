#pragma once

#include "../types.hpp"
#include <cctype>
#include <string>
#include <vector>

namespace quill {
namespace engine {

/** @brief One SEARCH/REPLACE block. */
struct PatchRule {
    std::string search;
    std::string replace;

    bool operator==(const PatchRule& other) const {
        return search == other.search && replace == other.replace;
    }
    bool operator!=(const PatchRule& other) const { return !(*this == other); }
};

/**
 * @brief Applies SEARCH/REPLACE rule sets to file content.
 *
 * Rule syntax:
 * @code
 * <<<<<<< SEARCH
 * old text
 * =======
 * new text
 * >>>>>>> REPLACE
 * @endcode
 *
 * Text outside blocks is ignored. Rules are applied in order, each against
 * the content produced by the previous one, and every rule must locate
 * exactly one target:
 * - an exact substring match is tried first; more than one is ambiguous;
 * - with no exact match, the search lines are compared against content lines
 *   with surrounding whitespace ignored; more than one hit is ambiguous;
 * - with neither, the target is not found.
 * A match lying inside a copy of the rule's own replacement does not count,
 * so re-applying a rule whose replacement contains its search text reports
 * the target as not found. In CRLF content, replacements keep CRLF endings.
 *
 * Pure functions; the dry run and the real run go through apply().
 */
class PatchEngine {
public:
    static constexpr const char* kSearchMarker = "<<<<<<< SEARCH";
    static constexpr const char* kSeparator = "=======";
    static constexpr const char* kReplaceMarker = ">>>>>>> REPLACE";

    /**
     * @brief Apply a rule set to content.
     *
     * @param original Current file content
     * @param rules Raw rule text (tag body)
     * @return Patched content, or PatchMalformed / PatchTargetNotFound /
     *         PatchTargetAmbiguous
     */
    static Expected<std::string> apply(const std::string& original, const std::string& rules) {
        auto parsed = parse_rules(rules);
        if (!parsed) {
            return tl::unexpected(parsed.error());
        }

        std::string content = original;
        for (size_t i = 0; i < parsed->size(); ++i) {
            auto next = apply_rule(content, (*parsed)[i], i, parsed->size());
            if (!next) {
                return tl::unexpected(next.error());
            }
            content = std::move(*next);
        }
        return content;
    }

    /// Split rule text into blocks, validating marker structure.
    static Expected<std::vector<PatchRule>> parse_rules(const std::string& rules) {
        enum class State { Outside, Search, Replace };

        std::vector<PatchRule> parsed;
        State state = State::Outside;
        std::vector<std::string> search_lines;
        std::vector<std::string> replace_lines;
        int line_no = 0;

        for (auto& line : split_lines(rules)) {
            ++line_no;
            if (!line.empty() && line.back() == '\r') line.pop_back();
            const std::string marker = rtrim(line);

            switch (state) {
                case State::Outside:
                    if (marker == kSearchMarker) {
                        state = State::Search;
                        search_lines.clear();
                        replace_lines.clear();
                    } else if (marker == kReplaceMarker) {
                        return tl::unexpected(malformed("REPLACE marker outside of a block", line_no));
                    }
                    break;

                case State::Search:
                    if (marker == kSeparator) {
                        state = State::Replace;
                    } else if (marker == kSearchMarker) {
                        return tl::unexpected(malformed("SEARCH marker inside a search section", line_no));
                    } else if (marker == kReplaceMarker) {
                        return tl::unexpected(malformed("REPLACE marker before the ======= separator", line_no));
                    } else {
                        search_lines.push_back(line);
                    }
                    break;

                case State::Replace:
                    if (marker == kReplaceMarker) {
                        PatchRule rule{join_lines(search_lines), join_lines(replace_lines)};
                        if (is_blank(rule.search)) {
                            return tl::unexpected(malformed("empty search section", line_no));
                        }
                        if (rule.search == rule.replace) {
                            return tl::unexpected(malformed("search and replace sections are identical", line_no));
                        }
                        parsed.push_back(std::move(rule));
                        state = State::Outside;
                    } else if (marker == kSearchMarker) {
                        return tl::unexpected(malformed("SEARCH marker inside a replace section", line_no));
                    } else {
                        replace_lines.push_back(line);
                    }
                    break;
            }
        }

        if (state != State::Outside) {
            return tl::unexpected(malformed("unterminated SEARCH/REPLACE block", line_no));
        }
        if (parsed.empty()) {
            return tl::unexpected(Error{ErrorCode::PatchMalformed, "No SEARCH/REPLACE blocks found"});
        }
        return parsed;
    }

private:
    static Expected<std::string> apply_rule(
        const std::string& content,
        const PatchRule& rule,
        size_t index,
        size_t total
    ) {
        const std::string where = "block " + std::to_string(index + 1) + " of " + std::to_string(total);
        const bool crlf = content.find("\r\n") != std::string::npos;
        const std::string search = crlf ? to_crlf(rule.search) : rule.search;
        const std::string replace = crlf ? to_crlf(rule.replace) : rule.replace;

        std::vector<size_t> exact;
        size_t applied = 0;
        for (size_t at = content.find(search); at != std::string::npos; at = content.find(search, at + 1)) {
            if (inside_replacement(content, at, search, replace)) {
                ++applied;
            } else {
                exact.push_back(at);
            }
        }
        if (exact.size() > 1) {
            return tl::unexpected(Error{
                ErrorCode::PatchTargetAmbiguous,
                "Search text of " + where + " matches more than once",
                first_line(rule.search)
            });
        }
        if (exact.size() == 1) {
            std::string out = content;
            out.replace(exact.front(), search.size(), replace);
            return out;
        }
        if (applied > 0) {
            return tl::unexpected(already_applied(where, rule));
        }

        // Whitespace-tolerant line match
        auto content_lines = split_lines(content);
        auto search_lines = strip_blank_edges(split_lines(rule.search));
        auto replace_lines = strip_blank_edges(split_lines(rule.replace));

        std::vector<size_t> hits;
        applied = 0;
        for (size_t i : line_matches(content_lines, search_lines)) {
            if (inside_replacement(content_lines, i, search_lines, replace_lines)) {
                ++applied;
            } else {
                hits.push_back(i);
            }
        }

        if (hits.empty()) {
            if (applied > 0) {
                return tl::unexpected(already_applied(where, rule));
            }
            return tl::unexpected(Error{
                ErrorCode::PatchTargetNotFound,
                "Search text of " + where + " not found",
                first_line(rule.search)
            });
        }
        if (hits.size() > 1) {
            return tl::unexpected(Error{
                ErrorCode::PatchTargetAmbiguous,
                "Search text of " + where + " matches " + std::to_string(hits.size()) +
                    " locations when ignoring whitespace",
                first_line(rule.search)
            });
        }

        // Replacement lines take the line endings of the lines they replace.
        const size_t start = hits.front();
        const size_t stop = start + search_lines.size();
        const bool cr_inside = ends_with_cr(content_lines[start]);
        const bool cr_last = ends_with_cr(content_lines[stop - 1]);

        std::vector<std::string> out_lines;
        out_lines.reserve(content_lines.size());
        for (size_t i = 0; i < start; ++i) out_lines.push_back(content_lines[i]);
        auto replacement = split_lines(rule.replace);
        for (size_t i = 0; i < replacement.size(); ++i) {
            const bool last = i + 1 == replacement.size();
            if (!ends_with_cr(replacement[i]) && (last ? cr_last : cr_inside)) replacement[i] += '\r';
            out_lines.push_back(std::move(replacement[i]));
        }
        for (size_t i = stop; i < content_lines.size(); ++i) out_lines.push_back(content_lines[i]);
        return join_lines(out_lines);
    }

    static Error already_applied(const std::string& where, const PatchRule& rule) {
        return Error{
            ErrorCode::PatchTargetNotFound,
            "Search text of " + where + " only occurs inside its replacement; already applied",
            first_line(rule.search)
        };
    }

    /// True when the match at `at` lies within a copy of `replace` already in `content`.
    static bool inside_replacement(const std::string& content, size_t at,
                                   const std::string& search, const std::string& replace) {
        for (size_t k = replace.find(search); k != std::string::npos; k = replace.find(search, k + 1)) {
            if (at >= k && content.compare(at - k, replace.size(), replace) == 0) return true;
        }
        return false;
    }

    /// Line-level form of the above, comparing trimmed lines.
    static bool inside_replacement(const std::vector<std::string>& content_lines, size_t at,
                                   const std::vector<std::string>& search_lines,
                                   const std::vector<std::string>& replace_lines) {
        for (size_t k : line_matches(replace_lines, search_lines)) {
            if (at < k || at - k + replace_lines.size() > content_lines.size()) continue;
            bool same = true;
            for (size_t j = 0; j < replace_lines.size(); ++j) {
                if (trim(content_lines[at - k + j]) != trim(replace_lines[j])) {
                    same = false;
                    break;
                }
            }
            if (same) return true;
        }
        return false;
    }

    /// Start indices where `needle` matches `lines` with surrounding whitespace ignored.
    static std::vector<size_t> line_matches(const std::vector<std::string>& lines,
                                            const std::vector<std::string>& needle) {
        std::vector<size_t> found;
        if (needle.empty() || needle.size() > lines.size()) return found;
        for (size_t i = 0; i + needle.size() <= lines.size(); ++i) {
            bool match = true;
            for (size_t j = 0; j < needle.size(); ++j) {
                if (trim(lines[i + j]) != trim(needle[j])) {
                    match = false;
                    break;
                }
            }
            if (match) found.push_back(i);
        }
        return found;
    }

    static std::vector<std::string> strip_blank_edges(std::vector<std::string> lines) {
        while (!lines.empty() && is_blank(lines.back())) lines.pop_back();
        while (!lines.empty() && is_blank(lines.front())) lines.erase(lines.begin());
        return lines;
    }

    static bool ends_with_cr(const std::string& line) {
        return !line.empty() && line.back() == '\r';
    }

    static std::string to_crlf(const std::string& text) {
        std::string out;
        out.reserve(text.size());
        for (size_t i = 0; i < text.size(); ++i) {
            if (text[i] == '\n' && (i == 0 || text[i - 1] != '\r')) out += '\r';
            out += text[i];
        }
        return out;
    }

    static Error malformed(const std::string& what, int line_no) {
        return Error{
            ErrorCode::PatchMalformed,
            "Malformed search/replace rules: " + what,
            "line " + std::to_string(line_no)
        };
    }

    static std::vector<std::string> split_lines(const std::string& text) {
        std::vector<std::string> lines;
        size_t pos = 0;
        while (true) {
            size_t nl = text.find('\n', pos);
            if (nl == std::string::npos) {
                lines.push_back(text.substr(pos));
                break;
            }
            lines.push_back(text.substr(pos, nl - pos));
            pos = nl + 1;
        }
        return lines;
    }

    static std::string join_lines(const std::vector<std::string>& lines) {
        std::string out;
        for (size_t i = 0; i < lines.size(); ++i) {
            if (i > 0) out += '\n';
            out += lines[i];
        }
        return out;
    }

    static std::string rtrim(const std::string& text) {
        size_t end = text.size();
        while (end > 0 && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
        return text.substr(0, end);
    }

    static std::string trim(const std::string& text) {
        size_t begin = 0;
        while (begin < text.size() && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
        return rtrim(text.substr(begin));
    }

    static bool is_blank(const std::string& text) {
        for (char c : text) {
            if (!std::isspace(static_cast<unsigned char>(c))) return false;
        }
        return true;
    }

    static std::string first_line(const std::string& text) {
        auto line = trim(text.substr(0, text.find('\n')));
        return line;
    }
};

} // namespace engine
} // namespace quill
