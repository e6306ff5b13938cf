#include "ea_gherkin/logging.hpp"
#include "ea_gherkin/text.hpp"

#include <cstdlib>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace ea::gherkin::logging {

namespace {

std::mutex g_init_mutex;

std::shared_ptr<spdlog::logger> create_locked(spdlog::level::level_enum level) {
    auto logger = spdlog::get(kLoggerName);
    if (!logger) {
        logger = spdlog::stderr_color_mt(kLoggerName);
        logger->set_pattern("[%l] %v");
    }
    logger->set_level(level);
    return logger;
}

}  // namespace

void init(spdlog::level::level_enum level) {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    (void)create_locked(level);
}

std::shared_ptr<spdlog::logger> get() {
    if (auto logger = spdlog::get(kLoggerName)) {
        return logger;
    }
    std::lock_guard<std::mutex> lock(g_init_mutex);
    if (auto logger = spdlog::get(kLoggerName)) {
        return logger;
    }
    return create_locked(level_from_environment().value_or(spdlog::level::warn));
}

std::optional<spdlog::level::level_enum> parse_level(std::string_view name) {
    const auto lowered = text::to_lower_copy(text::trim_copy(name));
    if (lowered == "trace") return spdlog::level::trace;
    if (lowered == "debug") return spdlog::level::debug;
    if (lowered == "info") return spdlog::level::info;
    if (lowered == "warn" || lowered == "warning") return spdlog::level::warn;
    if (lowered == "error") return spdlog::level::err;
    if (lowered == "off") return spdlog::level::off;
    return std::nullopt;
}

std::optional<spdlog::level::level_enum> level_from_environment() {
    const char* value = std::getenv("EA_GHERKIN_LOG_LEVEL");
    if (value == nullptr) {
        return std::nullopt;
    }
    return parse_level(value);
}

}  // namespace ea::gherkin::logging
