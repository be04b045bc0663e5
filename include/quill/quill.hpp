#pragma once

/**
 * @file quill.hpp
 * @brief Convenience header for the Quill action pipeline
 *
 * Quill turns the tag markup in a model response into changes to a project:
 * file writes, renames, deletes, search-replace patches, dependency
 * installs and SQL, followed by a single version-control commit.
 *
 * Quick Start:
 * @code
 * #include <quill/quill.hpp>
 *
 * auto orchestrator = quill::engine::ActionOrchestrator::create({store, vcs, packages});
 * if (!orchestrator) {
 *     std::cerr << orchestrator.error().to_string() << std::endl;
 *     return 1;
 * }
 *
 * auto result = (*orchestrator)->process({response_text, conversation_id, message_id});
 * if (result) {
 *     std::cout << "Committed: " << result->commit_id.value_or("(nothing)") << std::endl;
 * }
 * @endcode
 *
 * Key Components:
 * - quill::parser::TagExtractor: markup to typed actions
 * - quill::engine::PatchEngine: SEARCH/REPLACE blocks
 * - quill::engine::ActionOrchestrator: ordered execution and commit
 * - quill::sandbox::CompileCheckSandbox: speculative type-check in a worker process
 *
 * The service implementations (git, package managers) live in the
 * quill_services library; everything included here is header-only.
 */

#include "types.hpp"
#include "config_json.hpp"
#include "log.hpp"

#include "parser/path_utils.hpp"
#include "parser/tag_extractor.hpp"

#include "engine/patch_engine.hpp"
#include "engine/upload_registry.hpp"
#include "engine/commit_manager.hpp"
#include "engine/action_orchestrator.hpp"

#include "sandbox/overlay.hpp"
#include "sandbox/diagnostics.hpp"
#include "sandbox/worker_protocol.hpp"
#include "sandbox/compile_check.hpp"

#include "services/message_store.hpp"
#include "services/sqlite_store.hpp"
#include "services/version_control.hpp"
#include "services/git_version_control.hpp"
#include "services/package_manager.hpp"
#include "services/remote_service.hpp"
