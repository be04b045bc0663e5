/**
 * @file check_worker_main.cpp
 * @brief Isolated type-check worker spawned by CompileCheckSandbox.
 *
 * Reads one WorkerInput JSON line from stdin, builds the overlay, runs the
 * configured type checker on it and writes one WorkerOutput JSON line to
 * stdout. Logging goes to stderr. The exit code is 0 whenever a reply was
 * written; anything else is treated as a crash by the parent.
 */

#include "quill/log.hpp"
#include "quill/sandbox/diagnostics.hpp"
#include "quill/sandbox/overlay.hpp"
#include "quill/sandbox/worker_protocol.hpp"
#include "quill/services/process_runner.hpp"

#if !defined(_WIN32)
#include <unistd.h>
#endif

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace {

using quill::sandbox::WorkerOutput;
using quill::sandbox::WorkerProtocol;

void reply(const WorkerOutput& output) {
    std::cout << WorkerProtocol::encode_output(output) << "\n";
    std::cout.flush();
}

void reply_error(const quill::Error& error) {
    WorkerOutput output;
    output.success = false;
    output.error = error.to_string();
    reply(output);
}

std::vector<std::string> substitute(const std::vector<std::string>& command,
                                    const std::filesystem::path& overlay,
                                    const std::filesystem::path& build_info) {
    std::vector<std::string> argv;
    argv.reserve(command.size());
    for (auto arg : command) {
        for (const auto& [placeholder, value] : {
                 std::make_pair(std::string("{overlay}"), overlay.string()),
                 std::make_pair(std::string("{tsbuildinfo}"), build_info.string())}) {
            size_t pos = 0;
            while ((pos = arg.find(placeholder, pos)) != std::string::npos) {
                arg.replace(pos, placeholder.size(), value);
                pos += value.size();
            }
        }
        argv.push_back(std::move(arg));
    }
    return argv;
}

quill::Expected<quill::DiagnosticReport> check(const quill::sandbox::WorkerInput& input) {
    namespace fs = std::filesystem;
    using quill::sandbox::OverlayBuilder;

    const fs::path overlay = OverlayBuilder::overlay_dir(input.cache_dir, input.project_root);
    const fs::path build_info = OverlayBuilder::build_info_path(input.cache_dir, input.project_root);

    auto built = OverlayBuilder::build(input.project_root, overlay, input.changes);
    if (!built) {
        return tl::unexpected(built.error());
    }

    std::error_code ec;
    fs::current_path(overlay, ec);
    if (ec) {
        return tl::unexpected(quill::Error{quill::ErrorCode::OverlayFailed,
                                           "Cannot enter overlay: " + ec.message(), overlay.string()});
    }

    const auto argv = substitute(input.checker_command, overlay, build_info);
    auto logger = quill::log::get("quill.worker");
    logger->info("Running type checker on {} file(s): {}", *built,
                 quill::services::detail::join_command(argv));

    auto result = quill::services::run_process(argv);
    if (!result) {
        return tl::unexpected(quill::Error{quill::ErrorCode::TypeCheckerFailed,
                                           result.error().message, result.error().context});
    }

    auto report = quill::sandbox::DiagnosticParser::parse(result->stdout_text + "\n" + result->stderr_text, overlay);
    if (!result->ok() && report.empty()) {
        std::string detail = result->stderr_text.empty() ? result->stdout_text : result->stderr_text;
        if (detail.size() > 2000) {
            detail = detail.substr(detail.size() - 2000);
        }
        return tl::unexpected(quill::Error{
            quill::ErrorCode::TypeCheckerFailed,
            "Type checker exited with code " + std::to_string(result->exit_code) + " without diagnostics",
            detail
        });
    }

    logger->info("Type check produced {} error(s)", quill::sandbox::DiagnosticParser::error_count(report));
    return report;
}

} // namespace

int main() {
#if !defined(_WIN32)
    // Lead a process group so the parent can kill the checker along with us.
    setpgid(0, 0);
#endif

    if (const char* level = std::getenv("QUILL_LOG_LEVEL")) {
        quill::log::set_level(spdlog::level::from_str(level));
    }

    std::string line;
    if (!std::getline(std::cin, line)) {
        reply_error(quill::Error{quill::ErrorCode::SandboxProtocolError, "No input received"});
        return 0;
    }

    auto input = WorkerProtocol::decode_input(line);
    if (!input) {
        reply_error(input.error());
        return 0;
    }

    auto report = check(*input);
    if (!report) {
        reply_error(report.error());
        return 0;
    }

    WorkerOutput output;
    output.success = true;
    output.data = std::move(*report);
    reply(output);
    return 0;
}
