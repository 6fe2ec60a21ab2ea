#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace viewcache {

struct LoggingConfig;

struct LogField {
    std::string key;
    std::string value;
};

LogField string_field(std::string_view key, std::string_view value);
LogField int_field(std::string_view key, int64_t value);
LogField double_field(std::string_view key, double value);
LogField bool_field(std::string_view key, bool value);

// Installs the "viewcache" logger as spdlog default. VIEWCACHE_LOG_LEVEL and
// VIEWCACHE_LOG_PATTERN override the config values.
void init_logging(const LoggingConfig& config);
void shutdown_logging();

void write_log(spdlog::level::level_enum level, std::string_view message,
               std::initializer_list<LogField> fields = {});

inline void log_debug(std::string_view message, std::initializer_list<LogField> fields = {}) {
    write_log(spdlog::level::debug, message, fields);
}

inline void log_info(std::string_view message, std::initializer_list<LogField> fields = {}) {
    write_log(spdlog::level::info, message, fields);
}

inline void log_warn(std::string_view message, std::initializer_list<LogField> fields = {}) {
    write_log(spdlog::level::warn, message, fields);
}

inline void log_error(std::string_view message, std::initializer_list<LogField> fields = {}) {
    write_log(spdlog::level::err, message, fields);
}

} // namespace viewcache

#define VIEWCACHE_LOG_DEBUG(message, ...) ::viewcache::log_debug((message), ##__VA_ARGS__)
#define VIEWCACHE_LOG_INFO(message, ...) ::viewcache::log_info((message), ##__VA_ARGS__)
#define VIEWCACHE_LOG_WARN(message, ...) ::viewcache::log_warn((message), ##__VA_ARGS__)
#define VIEWCACHE_LOG_ERROR(message, ...) ::viewcache::log_error((message), ##__VA_ARGS__)
