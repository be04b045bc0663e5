/**
 * Quill Apply
 *
 * Applies the actions in a saved model response to a project directory and
 * commits the result with git.
 *
 * Usage:
 *   ./quill_apply <project_dir> <response_file> [options]
 *
 * Options:
 *   --config <file>        JSON configuration (pipeline and sandbox)
 *   --summary <text>       Commit summary (default: the response's chat-summary)
 *   --check                Type-check the changes in the sandbox first
 *   --dry-run              Only report what would fail; change nothing
 *   --cache-dir <dir>      Sandbox cache directory (default: <tmp>/quill-cache)
 *   --store <file>         SQLite store (default: in-memory)
 *   --verbose              Debug logging
 *   --help                 Show this help message
 */

#include "quill/quill.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>

struct CLIArgs {
    std::string project_dir;
    std::string response_file;
    std::string config_file;
    std::string summary;
    std::string cache_dir;
    std::string store_path = ":memory:";
    bool check = false;
    bool dry_run = false;
    bool verbose = false;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cout << "Quill Apply\n\n";
    std::cout << "Usage:\n";
    std::cout << "  " << program_name << " <project_dir> <response_file> [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config <file>        JSON configuration (pipeline and sandbox)\n";
    std::cout << "  --summary <text>       Commit summary (default: the response's chat-summary)\n";
    std::cout << "  --check                Type-check the changes in the sandbox first\n";
    std::cout << "  --dry-run              Only report what would fail; change nothing\n";
    std::cout << "  --cache-dir <dir>      Sandbox cache directory (default: <tmp>/quill-cache)\n";
    std::cout << "  --store <file>         SQLite store (default: in-memory)\n";
    std::cout << "  --verbose              Debug logging\n";
    std::cout << "  --help                 Show this help message\n\n";
    std::cout << "Example:\n";
    std::cout << "  " << program_name << " ./my-app response.txt --check --summary \"Add login page\"\n";
}

CLIArgs parse_args(int argc, char** argv) {
    CLIArgs args;

    if (argc < 3 || std::string(argv[1]) == "--help") {
        args.help = true;
        return args;
    }

    args.project_dir = argv[1];
    args.response_file = argv[2];

    for (int i = 3; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            args.help = true;
            return args;
        }
        else if (arg == "--config" && i + 1 < argc) {
            args.config_file = argv[++i];
        }
        else if (arg == "--summary" && i + 1 < argc) {
            args.summary = argv[++i];
        }
        else if (arg == "--cache-dir" && i + 1 < argc) {
            args.cache_dir = argv[++i];
        }
        else if (arg == "--store" && i + 1 < argc) {
            args.store_path = argv[++i];
        }
        else if (arg == "--check") {
            args.check = true;
        }
        else if (arg == "--dry-run") {
            args.dry_run = true;
        }
        else if (arg == "--verbose") {
            args.verbose = true;
        }
        else {
            std::cerr << "Unknown option: " << arg << "\n";
            args.help = true;
            return args;
        }
    }

    return args;
}

void print_outputs(const char* label, const std::vector<quill::Output>& outputs) {
    for (const auto& output : outputs) {
        std::cout << "  [" << label << "] " << output.message << "\n";
        if (!output.detail.empty()) {
            std::cout << "      " << output.detail << "\n";
        }
    }
}

int main(int argc, char** argv) {
    namespace fs = std::filesystem;

    CLIArgs args = parse_args(argc, argv);
    if (args.help) {
        print_usage(argv[0]);
        return args.project_dir.empty() ? 1 : 0;
    }

    if (args.verbose) {
        quill::log::set_level(spdlog::level::debug);
    }

    quill::Settings settings;
    if (!args.config_file.empty()) {
        auto loaded = quill::Settings::load(args.config_file);
        if (!loaded) {
            std::cerr << "Error: " << loaded.error().to_string() << "\n";
            return 1;
        }
        settings = std::move(*loaded);
    }

    std::ifstream in(args.response_file, std::ios::binary);
    if (!in) {
        std::cerr << "Error: cannot read " << args.response_file << "\n";
        return 1;
    }
    const std::string raw{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    const std::string response = quill::parser::sanitize_tag_attributes(raw);

    std::error_code ec;
    const fs::path root = fs::canonical(args.project_dir, ec);
    if (ec || !fs::is_directory(root, ec)) {
        std::cerr << "Error: " << args.project_dir << " is not a directory\n";
        return 1;
    }

    auto extracted = quill::parser::TagExtractor::extract(response);
    std::cout << "Found " << extracted.actions.size() << " action(s)\n";
    for (const auto& warning : extracted.warnings) {
        std::cout << "  [warning] " << warning << "\n";
    }

    // ------------------------------------------------------------------------
    // Pre-flight: dry run and optional type-check
    // ------------------------------------------------------------------------

    auto issues = quill::engine::ActionOrchestrator::dry_run_search_replace(extracted.actions, root);
    for (const auto& issue : issues) {
        std::cout << "  [search-replace] " << issue.file_path << ": " << issue.error << "\n";
    }

    if (args.check) {
        const fs::path cache = args.cache_dir.empty() ? fs::temp_directory_path() / "quill-cache" : fs::path(args.cache_dir);
        quill::sandbox::CompileCheckSandbox sandbox(settings.sandbox);

        std::cout << "Type-checking...\n";
        auto report = sandbox.check(quill::sandbox::VirtualChanges::from_actions(extracted.actions), root, cache).get();
        if (!report) {
            std::cout << "  Type-check unavailable: " << report.error().to_string() << "\n";
        } else if (report->empty()) {
            std::cout << "  No problems found\n";
        } else {
            std::cout << quill::sandbox::DiagnosticParser::format(*report);
        }
    }

    if (args.dry_run) {
        return issues.empty() ? 0 : 2;
    }

    // ------------------------------------------------------------------------
    // Apply
    // ------------------------------------------------------------------------

    auto store = quill::services::SqliteStore::open(args.store_path);
    if (!store) {
        std::cerr << "Error: " << store.error().to_string() << "\n";
        return 1;
    }

    auto project_id = (*store)->add_project(root.string());
    auto conversation_id = project_id.and_then([&](quill::ProjectId id) { return (*store)->add_conversation(id); });
    auto message_id = conversation_id.and_then([&](quill::ConversationId id) {
        return (*store)->add_message(id, quill::services::Role::Assistant, response);
    });
    if (!message_id) {
        std::cerr << "Error: " << message_id.error().to_string() << "\n";
        return 1;
    }

    auto git = std::make_shared<quill::services::GitVersionControl>();
    if (!fs::exists(root / ".git")) {
        if (auto initialized = git->init(root.string()); !initialized) {
            std::cerr << "Error: " << initialized.error().to_string() << "\n";
            return 1;
        }
    }

    quill::engine::ActionOrchestrator::Services services;
    services.store = *store;
    services.vcs = git;
    services.packages = std::make_shared<quill::services::ShellPackageManager>();

    auto orchestrator = quill::engine::ActionOrchestrator::create(services, settings.pipeline);
    if (!orchestrator) {
        std::cerr << "Error: " << orchestrator.error().to_string() << "\n";
        return 1;
    }

    quill::engine::ProcessRequest request;
    request.response_text = response;
    request.conversation_id = *conversation_id;
    request.message_id = *message_id;
    if (!args.summary.empty()) {
        request.chat_summary = args.summary;
    }

    auto result = (*orchestrator)->process(request);
    if (!result) {
        std::cerr << "Error: " << result.error().to_string() << "\n";
        return 1;
    }

    std::cout << "Wrote " << result->written_paths.size() << ", renamed " << result->renamed_paths.size()
              << ", deleted " << result->deleted_paths.size() << " file(s)\n";
    if (result->commit_id) {
        std::cout << "Commit: " << *result->commit_id << "\n";
    } else {
        std::cout << "No changes to commit\n";
    }
    if (result->out_of_band_files) {
        std::cout << "Included " << result->out_of_band_files->size() << " file(s) edited outside Quill\n";
    }
    if (result->out_of_band_error) {
        std::cout << "  [warning] " << *result->out_of_band_error << "\n";
    }
    print_outputs("warning", result->warnings);
    print_outputs("error", result->errors);

    return result->errors.empty() ? 0 : 2;
}
