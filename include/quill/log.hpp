#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <mutex>
#include <string>

namespace quill {
namespace log {

/**
 * @brief Get (or lazily create) a named component logger.
 *
 * All component loggers write to stderr so that stdout stays free for
 * machine-readable output (the check worker speaks JSON on stdout).
 */
inline std::shared_ptr<spdlog::logger> get(const std::string& name) {
    static std::mutex registry_mutex;
    std::lock_guard<std::mutex> lock(registry_mutex);

    auto logger = spdlog::get(name);
    if (!logger) {
        logger = spdlog::stderr_color_mt(name);
    }
    return logger;
}

/// Apply a level to every registered logger and to loggers created later.
inline void set_level(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

} // namespace log
} // namespace quill
