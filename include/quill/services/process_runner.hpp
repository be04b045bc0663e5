#pragma once

#include "../types.hpp"

// subprocess.h (sheredom single-header process library)
#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4200)
#endif

#include "subprocess.h"

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

#include <csignal>
#include <cstdio>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

namespace quill {
namespace services {

/** @brief Captured outcome of a finished child process. */
struct ProcessResult {
    int exit_code = 0;
    std::string stdout_text;
    std::string stderr_text;

    bool ok() const { return exit_code == 0; }
};

namespace detail {

/**
 * @brief Ignore SIGPIPE process-wide (POSIX only).
 *
 * A child that exits before reading its stdin would otherwise kill the
 * caller with SIGPIPE on the next write.
 */
inline void ignore_sigpipe() {
#if !defined(_WIN32)
    static std::once_flag flag;
    std::call_once(flag, []() { std::signal(SIGPIPE, SIG_IGN); });
#endif
}

/// Read a stream to EOF.
inline std::string read_all(FILE* stream) {
    std::string out;
    if (stream == nullptr) return out;
    char chunk[4096];
    size_t n = 0;
    while ((n = fread(chunk, 1, sizeof(chunk), stream)) > 0) {
        out.append(chunk, n);
    }
    return out;
}

inline std::string join_command(const std::vector<std::string>& argv) {
    std::string joined;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) joined += ' ';
        joined += argv[i];
    }
    return joined;
}

} // namespace detail

/**
 * @brief Run a command to completion and capture its output.
 *
 * The command is resolved through PATH and inherits the environment.
 * Stdout and stderr are drained concurrently so neither pipe can fill up and
 * stall the child. A non-zero exit is reported in the result, not as an
 * error; only a failure to spawn is an error.
 *
 * @param argv Program followed by its arguments
 * @param input Optional text written to the child's stdin before it is closed
 */
inline Expected<ProcessResult> run_process(
    const std::vector<std::string>& argv,
    const std::optional<std::string>& input = std::nullopt
) {
    if (argv.empty()) {
        return tl::unexpected(Error{ErrorCode::ProcessSpawnFailed, "Empty command line"});
    }
    detail::ignore_sigpipe();

    // All c_str() pointers stay valid: argv is not modified while cmd_parts lives.
    std::vector<const char*> cmd_parts;
    cmd_parts.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        cmd_parts.push_back(arg.c_str());
    }
    cmd_parts.push_back(nullptr);

    subprocess_s process{};
    const int options = subprocess_option_inherit_environment |
                        subprocess_option_search_user_path;
    if (subprocess_create(cmd_parts.data(), options, &process) != 0) {
        return tl::unexpected(Error{
            ErrorCode::ProcessSpawnFailed,
            "Failed to spawn process: " + argv.front(),
            detail::join_command(argv)
        });
    }

    FILE* stdin_fp = subprocess_stdin(&process);
    if (stdin_fp != nullptr) {
        if (input.has_value() && !input->empty()) {
            fwrite(input->data(), 1, input->size(), stdin_fp);
        }
        fclose(stdin_fp);
        process.stdin_file = nullptr;  // subprocess_destroy must not close it again
    }

    ProcessResult result;
    std::thread stderr_reader;
    try {
        stderr_reader = std::thread([&process, &result]() {
            result.stderr_text = detail::read_all(subprocess_stderr(&process));
        });
    } catch (const std::system_error& e) {
        subprocess_terminate(&process);
        subprocess_join(&process, nullptr);
        subprocess_destroy(&process);
        return tl::unexpected(Error{
            ErrorCode::ProcessFailed,
            std::string("Failed to start stderr reader: ") + e.what(),
            detail::join_command(argv)
        });
    }

    result.stdout_text = detail::read_all(subprocess_stdout(&process));
    stderr_reader.join();

    int exit_code = 0;
    if (subprocess_join(&process, &exit_code) != 0) {
        subprocess_destroy(&process);
        return tl::unexpected(Error{
            ErrorCode::ProcessFailed,
            "Failed to wait for process: " + argv.front(),
            detail::join_command(argv)
        });
    }
    subprocess_destroy(&process);

    result.exit_code = exit_code;
    return result;
}

} // namespace services
} // namespace quill
