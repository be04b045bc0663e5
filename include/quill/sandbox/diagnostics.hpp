#pragma once

#include "../types.hpp"
#include <cctype>
#include <filesystem>
#include <regex>
#include <string>

namespace quill {
namespace sandbox {

/**
 * @brief Parses type-checker output into a DiagnosticReport.
 *
 * Understands the non-pretty tsc format:
 * @code
 * src/App.tsx(12,5): error TS2322: Type 'string' is not assignable to type 'number'.
 *   Additional detail lines are indented.
 * error TS5083: Cannot read file 'tsconfig.json'.
 * @endcode
 * Indented lines are folded into the preceding diagnostic. Diagnostics that
 * carry no file are filed under kGlobalKey. Absolute paths inside the overlay
 * are reported relative to it, so keys are project-relative.
 */
class DiagnosticParser {
public:
    static constexpr const char* kGlobalKey = "(global)";

    static DiagnosticReport parse(const std::string& output, const std::filesystem::path& overlay_root = {}) {
        static const std::regex located(
            R"(^(.+)\((\d+),(\d+)\): (error|warning|message)(?: (TS\d+))?: (.*)$)");
        static const std::regex global(
            R"(^(error|warning|message)(?: (TS\d+))?: (.*)$)");

        DiagnosticReport report;
        Diagnostic* last = nullptr;

        size_t pos = 0;
        while (pos <= output.size()) {
            size_t nl = output.find('\n', pos);
            if (nl == std::string::npos) nl = output.size();
            std::string line = output.substr(pos, nl - pos);
            pos = nl + 1;

            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.empty()) continue;

            std::smatch m;
            if (std::regex_match(line, m, located)) {
                auto& bucket = report[relative_key(m[1].str(), overlay_root)];
                bucket.push_back(Diagnostic{
                    parse_severity(m[4].str()),
                    std::stoi(m[2].str()),
                    std::stoi(m[3].str()),
                    m[5].str(),
                    m[6].str()
                });
                last = &bucket.back();
            } else if (std::regex_match(line, m, global)) {
                auto& bucket = report[kGlobalKey];
                bucket.push_back(Diagnostic{parse_severity(m[1].str()), 0, 0, m[2].str(), m[3].str()});
                last = &bucket.back();
            } else if (last != nullptr && std::isspace(static_cast<unsigned char>(line.front()))) {
                size_t start = line.find_first_not_of(" \t");
                last->message += "\n" + line.substr(start);
            } else {
                last = nullptr;
            }
        }
        return report;
    }

    /// Total number of error-severity diagnostics.
    static size_t error_count(const DiagnosticReport& report) {
        size_t count = 0;
        for (const auto& [path, diagnostics] : report) {
            for (const auto& d : diagnostics) {
                if (d.severity == Severity::Error) ++count;
            }
        }
        return count;
    }

    /// Human-readable summary, one diagnostic per line.
    static std::string format(const DiagnosticReport& report) {
        std::string out;
        for (const auto& [path, diagnostics] : report) {
            for (const auto& d : diagnostics) {
                out += path + ":" + std::to_string(d.line) + ":" + std::to_string(d.column) + " " +
                       severity_to_string(d.severity);
                if (!d.code.empty()) out += " " + d.code;
                out += ": " + d.message + "\n";
            }
        }
        return out;
    }

private:
    static Severity parse_severity(const std::string& text) {
        if (text == "warning") return Severity::Warning;
        if (text == "message") return Severity::Message;
        return Severity::Error;
    }

    static std::string relative_key(const std::string& raw, const std::filesystem::path& overlay_root) {
        std::filesystem::path p(raw);
        if (!overlay_root.empty() && p.is_absolute()) {
            auto rel = p.lexically_normal().lexically_relative(overlay_root.lexically_normal());
            if (!rel.empty() && *rel.begin() != "..") {
                return rel.generic_string();
            }
        }
        return p.lexically_normal().generic_string();
    }
};

} // namespace sandbox
} // namespace quill
