#include "upsync/log.h"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace upsync {
namespace log {

namespace {

constexpr const char* kLoggerName = "upsync";
constexpr const char* kLogFormat  = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

std::mutex s_mutex;

std::shared_ptr<spdlog::logger> create_logger() {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    sink->set_color_mode(spdlog::color_mode::automatic);
    sink->set_pattern(kLogFormat);

    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sink);
    logger->set_level(spdlog::level::warn);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    return logger;
}

} // anonymous namespace

void init(spdlog::level::level_enum level) {
    get()->set_level(level);
}

std::shared_ptr<spdlog::logger> get() {
    std::lock_guard<std::mutex> lk(s_mutex);
    auto logger = spdlog::get(kLoggerName);
    if (!logger) logger = create_logger();
    return logger;
}

} // namespace log
} // namespace upsync
