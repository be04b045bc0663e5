#pragma once

#include "../types.hpp"
#include "../log.hpp"
#include "../services/process_runner.hpp"
#include "overlay.hpp"
#include "worker_protocol.hpp"

#if !defined(_WIN32)
#include <signal.h>
#include <sys/types.h>
#endif

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <future>
#include <optional>
#include <string>
#include <system_error>
#include <thread>

namespace quill {
namespace sandbox {

/**
 * @brief Speculative type-check of a project with virtual changes applied.
 *
 * Each check spawns a fresh `quill_check_worker` process, hands it a
 * WorkerInput line and waits for one WorkerOutput line. The worker is killed
 * as soon as a line arrives or the configured timeout expires. The timeout
 * bounds the whole exchange (writing the request, waiting for the reply and
 * waiting for the worker to exit), so a hanging or crashing type checker can
 * never block the caller.
 *
 * Failures are distinct:
 * - SandboxTimeout: no reply, or no exit after closing stdout, within
 *   SandboxConfig::timeout
 * - SandboxWorkerCrashed: the worker exited abnormally without a reply
 * - SandboxWorkerFailed: the worker replied with success=false
 * - SandboxProtocolError: the reply was not valid WorkerOutput
 *
 * @threadsafety check() and run() may be called concurrently; every call
 * owns its own worker process.
 */
class CompileCheckSandbox {
public:
    explicit CompileCheckSandbox(SandboxConfig config = {})
        : config_(std::move(config)) {}

    const SandboxConfig& config() const { return config_; }

    /**
     * @brief Start a check in the background.
     *
     * The returned future always becomes ready: with a report, or with the
     * error describing why no report could be produced.
     */
    std::future<Expected<DiagnosticReport>> check(
        VirtualChanges changes,
        std::filesystem::path project_root,
        std::filesystem::path cache_dir
    ) const {
        return std::async(std::launch::async,
            [config = config_, changes = std::move(changes),
             project_root = std::move(project_root), cache_dir = std::move(cache_dir)]() {
                return CompileCheckSandbox(config).run(changes, project_root, cache_dir);
            });
    }

    /// Blocking variant of check().
    Expected<DiagnosticReport> run(
        const VirtualChanges& changes,
        const std::filesystem::path& project_root,
        const std::filesystem::path& cache_dir
    ) const {
        namespace fs = std::filesystem;

        if (auto valid = config_.validate(); !valid) {
            return tl::unexpected(valid.error());
        }

        std::error_code ec;
        if (project_root.empty() || !fs::is_directory(project_root, ec)) {
            return tl::unexpected(Error{ErrorCode::InvalidProjectRoot, "Project root is not a directory",
                                        project_root.string()});
        }
        if (cache_dir.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidCacheDir, "Cache directory cannot be empty"});
        }
        fs::create_directories(cache_dir, ec);
        if (ec) {
            return tl::unexpected(Error{ErrorCode::InvalidCacheDir,
                                        "Cannot create cache directory: " + ec.message(), cache_dir.string()});
        }

        WorkerInput input{
            changes,
            fs::absolute(project_root).lexically_normal().string(),
            fs::absolute(cache_dir).lexically_normal().string(),
            config_.checker_command
        };
        const std::string request = WorkerProtocol::encode_input(input) + "\n";

        return supervise(request);
    }

private:
    static constexpr size_t kStderrTailBytes = 2000;

    SandboxConfig config_;

    static std::shared_ptr<spdlog::logger> logger() {
        return log::get("quill.sandbox");
    }

    /// Read up to the first newline. nullopt when the stream ends with nothing read.
    static std::optional<std::string> read_line(FILE* stream) {
        if (stream == nullptr) return std::nullopt;
        std::string line;
        char chunk[4096];
        while (fgets(chunk, sizeof(chunk), stream) != nullptr) {
            line += chunk;
            if (!line.empty() && line.back() == '\n') {
                line.pop_back();
                return line;
            }
        }
        if (line.empty()) return std::nullopt;
        return line;
    }

    static std::string tail(const std::string& text) {
        if (text.size() <= kStderrTailBytes) return text;
        return text.substr(text.size() - kStderrTailBytes);
    }

    /// Kill the worker and everything it spawned (the worker leads its own process group).
    static void kill_worker(subprocess_s& process) {
#if !defined(_WIN32)
        if (process.child <= 0) return;  // already reaped
        ::kill(-process.child, SIGKILL);
#endif
        subprocess_terminate(&process);
    }

    Expected<DiagnosticReport> supervise(const std::string& request) const {
        using Clock = std::chrono::steady_clock;
        const auto deadline = Clock::now() + config_.timeout;

        services::detail::ignore_sigpipe();

        std::vector<const char*> cmd_parts;
        cmd_parts.reserve(config_.worker_command.size() + 1);
        for (const auto& arg : config_.worker_command) {
            cmd_parts.push_back(arg.c_str());
        }
        cmd_parts.push_back(nullptr);

        subprocess_s process{};
        const int options = subprocess_option_inherit_environment |
                            subprocess_option_search_user_path;
        if (subprocess_create(cmd_parts.data(), options, &process) != 0) {
            return tl::unexpected(Error{
                ErrorCode::SandboxSpawnFailed,
                "Failed to spawn check worker: " + config_.worker_command.front(),
                services::detail::join_command(config_.worker_command)
            });
        }

        // The writer owns stdin; a worker that never reads it cannot stall us
        // past the deadline, and one that dies first is reported as a crash.
        FILE* stdin_fp = subprocess_stdin(&process);
        process.stdin_file = nullptr;
#if !defined(_WIN32)
        const pid_t worker_pid = process.child;
#endif

        std::promise<std::optional<std::string>> line_promise;
        auto line_future = line_promise.get_future();
        std::string stderr_text;
        std::thread stdin_writer;
        std::thread stdout_reader;
        std::thread stderr_reader;

        auto join_threads = [&]() {
            if (stdin_writer.joinable()) stdin_writer.join();
            if (stdout_reader.joinable()) stdout_reader.join();
            if (stderr_reader.joinable()) stderr_reader.join();
        };

        try {
            stdin_writer = std::thread([stdin_fp, &request]() {
                if (stdin_fp == nullptr) return;
                if (fwrite(request.data(), 1, request.size(), stdin_fp) != request.size()) {
                    logger()->debug("Check worker did not accept the full request");
                }
                fclose(stdin_fp);
            });
            stdout_reader = std::thread([&process, &line_promise]() {
                line_promise.set_value(read_line(subprocess_stdout(&process)));
            });
            stderr_reader = std::thread([&process, &stderr_text]() {
                stderr_text = services::detail::read_all(subprocess_stderr(&process));
            });
        } catch (const std::system_error& e) {
            kill_worker(process);
            if (!stdin_writer.joinable() && stdin_fp != nullptr) fclose(stdin_fp);
            join_threads();
            subprocess_join(&process, nullptr);
            subprocess_destroy(&process);
            return tl::unexpected(Error{
                ErrorCode::SandboxSpawnFailed,
                std::string("Failed to start worker I/O: ") + e.what()
            });
        }

        auto timed_out = [&]() -> Expected<DiagnosticReport> {
            kill_worker(process);
            join_threads();
            subprocess_join(&process, nullptr);
            subprocess_destroy(&process);
            logger()->warn("Check worker timed out after {} ms", config_.timeout.count());
            return tl::unexpected(Error{
                ErrorCode::SandboxTimeout,
                "Type check timed out after " + std::to_string(config_.timeout.count()) + " ms",
                tail(stderr_text)
            });
        };

        if (line_future.wait_until(deadline) != std::future_status::ready) {
            return timed_out();
        }

        std::optional<std::string> reply = line_future.get();
        if (reply.has_value()) {
            kill_worker(process);
        } else {
            // stdout closed without a reply; the worker has until the deadline to exit.
            while (subprocess_alive(&process) > 0) {
                if (Clock::now() >= deadline) {
                    return timed_out();
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
#if !defined(_WIN32)
            ::kill(-worker_pid, SIGKILL);  // leftovers in the worker's process group
#endif
        }
        join_threads();

        int exit_code = 0;
        if (subprocess_join(&process, &exit_code) != 0) {
            exit_code = -1;
        }
        subprocess_destroy(&process);

        if (!reply.has_value()) {
            if (exit_code != 0) {
                logger()->warn("Check worker exited with code {} without a result", exit_code);
                return tl::unexpected(Error{
                    ErrorCode::SandboxWorkerCrashed,
                    "Check worker exited with code " + std::to_string(exit_code) + " before reporting a result",
                    tail(stderr_text)
                });
            }
            return tl::unexpected(Error{
                ErrorCode::SandboxProtocolError,
                "Check worker exited without reporting a result",
                tail(stderr_text)
            });
        }

        auto output = WorkerProtocol::decode_output(*reply);
        if (!output) {
            return tl::unexpected(output.error());
        }
        if (!output->success) {
            return tl::unexpected(Error{
                ErrorCode::SandboxWorkerFailed,
                output->error.value_or("Check worker reported a failure"),
                tail(stderr_text)
            });
        }

        DiagnosticReport report = output->data.value_or(DiagnosticReport{});
        logger()->debug("Type check finished: {} file(s) with diagnostics", report.size());
        return report;
    }
};

} // namespace sandbox
} // namespace quill
