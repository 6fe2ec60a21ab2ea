#include "viewcache/logging.hpp"
#include "viewcache/config.hpp"

#include <cstdlib>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace viewcache {

namespace {

constexpr const char* LOGGER_NAME = "viewcache";

std::string resolve_level(const LoggingConfig& config) {
    if (const char* level = std::getenv("VIEWCACHE_LOG_LEVEL")) {
        return level;
    }
    return config.level.empty() ? "info" : config.level;
}

std::string resolve_pattern(const LoggingConfig& config) {
    if (const char* pattern = std::getenv("VIEWCACHE_LOG_PATTERN")) {
        return pattern;
    }
    return config.pattern.empty() ? LoggingConfig{}.pattern : config.pattern;
}

std::string serialize_fields(std::initializer_list<LogField> fields) {
    std::ostringstream out;
    bool first = true;
    for (const auto& field : fields) {
        if (!first) {
            out << ' ';
        }
        first = false;
        out << field.key << '=' << field.value;
    }
    return out.str();
}

} // namespace

LogField string_field(std::string_view key, std::string_view value) {
    return {std::string(key), std::string(value)};
}

LogField int_field(std::string_view key, int64_t value) {
    return {std::string(key), std::to_string(value)};
}

LogField double_field(std::string_view key, double value) {
    std::ostringstream out;
    out << value;
    return {std::string(key), out.str()};
}

LogField bool_field(std::string_view key, bool value) {
    return {std::string(key), value ? "true" : "false"};
}

void init_logging(const LoggingConfig& config) {
    auto logger = spdlog::get(LOGGER_NAME);
    if (!logger) {
        logger = spdlog::stdout_color_mt(LOGGER_NAME);
    }
    logger->set_pattern(resolve_pattern(config));
    logger->set_level(spdlog::level::from_str(resolve_level(config)));
    spdlog::set_default_logger(logger);
    spdlog::flush_on(spdlog::level::warn);
}

void shutdown_logging() {
    spdlog::shutdown();
}

void write_log(spdlog::level::level_enum level, std::string_view message,
               std::initializer_list<LogField> fields) {
    auto* logger = spdlog::default_logger_raw();
    if (logger == nullptr || !logger->should_log(level)) {
        return;
    }
    auto serialized = serialize_fields(fields);
    if (serialized.empty()) {
        logger->log(level, "{}", message);
        return;
    }
    logger->log(level, "{} {}", message, serialized);
}

} // namespace viewcache
