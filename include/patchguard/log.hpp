#pragma once

/// @file log.hpp
/// @brief Library logger.
///
/// All diagnostics go through one spdlog logger named "patchguard",
/// writing to stderr. It is created on first use with level `warn`.
///
///   warn  - shrinkage guard rejections
///   info  - batches rejected by pre-validation or by failed operations
///   debug - per-operation errors, skipped duplicates, unresolved `$ref`s
///
/// An application that registers its own logger under the same name before
/// first use gets that logger instead.

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>

namespace patchguard::log {

inline constexpr const char* kLoggerName = "patchguard";

/// @brief The shared library logger.
inline std::shared_ptr<spdlog::logger> get() {
    static std::shared_ptr<spdlog::logger> logger = [] {
        if (auto existing = spdlog::get(kLoggerName)) return existing;
        auto created = spdlog::stderr_color_mt(kLoggerName);
        created->set_level(spdlog::level::warn);
        return created;
    }();
    return logger;
}

inline void set_level(spdlog::level::level_enum level) {
    get()->set_level(level);
}

} // namespace patchguard::log
