#include "quill/services/git_version_control.hpp"
#include "quill/log.hpp"

namespace quill {
namespace services {

namespace {

std::shared_ptr<spdlog::logger> logger() {
    return log::get("quill.git");
}

std::string trim_output(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

} // namespace

Expected<ProcessResult> GitVersionControl::git(const std::string& root, const std::vector<std::string>& args) {
    std::vector<std::string> argv = {
        config_.git_executable,
        "-c", "user.name=" + config_.author_name,
        "-c", "user.email=" + config_.author_email,
        "-C", root
    };
    argv.insert(argv.end(), args.begin(), args.end());

    logger()->debug("{}", detail::join_command(argv));
    auto result = run_process(argv);
    if (!result) {
        return tl::unexpected(Error{ErrorCode::VersionControlFailed, result.error().message, result.error().context});
    }
    if (!result->ok()) {
        std::string message = trim_output(result->stderr_text);
        if (message.empty()) message = trim_output(result->stdout_text);
        return tl::unexpected(Error{
            ErrorCode::VersionControlFailed,
            "git " + args.front() + " failed (exit " + std::to_string(result->exit_code) + "): " + message,
            root
        });
    }
    return result;
}

Expected<void> GitVersionControl::init(const std::string& root) {
    auto result = git(root, {"init", "-q"});
    if (!result) {
        return tl::unexpected(result.error());
    }
    return {};
}

Expected<void> GitVersionControl::add(const std::string& root, const std::string& path) {
    auto result = git(root, {"add", "--", path});
    if (!result) {
        return tl::unexpected(result.error());
    }
    return {};
}

Expected<void> GitVersionControl::remove(const std::string& root, const std::string& path) {
    auto result = git(root, {"rm", "-r", "-q", "--cached", "--ignore-unmatch", "--", path});
    if (!result) {
        return tl::unexpected(result.error());
    }
    return {};
}

Expected<void> GitVersionControl::add_all(const std::string& root) {
    auto result = git(root, {"add", "-A"});
    if (!result) {
        return tl::unexpected(result.error());
    }
    return {};
}

Expected<std::string> GitVersionControl::commit(const std::string& root, const std::string& message, bool amend) {
    std::vector<std::string> args = {"commit", "-q", "-m", message};
    if (amend) {
        args.push_back("--amend");
    }
    auto committed = git(root, args);
    if (!committed) {
        return tl::unexpected(committed.error());
    }

    auto head = git(root, {"rev-parse", "HEAD"});
    if (!head) {
        return tl::unexpected(head.error());
    }
    return trim_output(head->stdout_text);
}

Expected<std::vector<std::string>> GitVersionControl::list_uncommitted(const std::string& root) {
    auto result = git(root, {"status", "--porcelain", "-z", "--untracked-files=all"});
    if (!result) {
        return tl::unexpected(result.error());
    }
    return parse_porcelain(result->stdout_text);
}

std::vector<std::string> GitVersionControl::parse_porcelain(const std::string& output) {
    // -z format: "XY <path>\0", renames and copies add "<original>\0".
    std::vector<std::string> paths;
    size_t pos = 0;
    while (pos < output.size()) {
        size_t end = output.find('\0', pos);
        if (end == std::string::npos) end = output.size();
        const std::string entry = output.substr(pos, end - pos);
        pos = end + 1;

        if (entry.size() < 4) continue;
        paths.push_back(entry.substr(3));

        const char index_status = entry[0];
        if (index_status == 'R' || index_status == 'C') {
            size_t skip = output.find('\0', pos);
            pos = skip == std::string::npos ? output.size() : skip + 1;
        }
    }
    return paths;
}

} // namespace services
} // namespace quill
