#pragma once

/// @file log.h
/// The engine's single spdlog logger.  Output goes to stderr; stdout is
/// reserved for JSON results.

#include <spdlog/spdlog.h>

#include <memory>

namespace upsync {
namespace log {

/// Create (or reconfigure) the "upsync" logger at @p level.
void init(spdlog::level::level_enum level);

/// The "upsync" logger, created at `warn` on first use if init() was not
/// called.
std::shared_ptr<spdlog::logger> get();

} // namespace log
} // namespace upsync
