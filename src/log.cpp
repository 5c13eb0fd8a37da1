#include "switchyard/log.hpp"

#include <mutex>
#include <vector>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace switchyard {
namespace log {

namespace {

struct LoggerState {
    std::mutex mutex;
    spdlog::sink_ptr sink;
    spdlog::level::level_enum level = spdlog::level::info;
    std::vector<std::shared_ptr<spdlog::logger>> loggers;
};

LoggerState& state() {
    static LoggerState instance;
    return instance;
}

} // namespace

std::shared_ptr<spdlog::logger> get(const std::string& name) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);

    if (auto existing = spdlog::get(name)) {
        return existing;
    }

    if (!s.sink) {
        s.sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    }

    auto logger = std::make_shared<spdlog::logger>(name, s.sink);
    logger->set_level(s.level);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    spdlog::register_logger(logger);
    s.loggers.push_back(logger);
    return logger;
}

Expected<void> set_level(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to off; only accept "off" when asked for it
    if (parsed == spdlog::level::off && level != "off") {
        return tl::unexpected(Error{ErrorCode::InvalidConfig, "Unknown log level: " + level});
    }

    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.level = parsed;
    for (auto& logger : s.loggers) {
        logger->set_level(parsed);
    }
    return {};
}

} // namespace log
} // namespace switchyard
