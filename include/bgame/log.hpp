#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <json/json.h>

namespace bgame {

enum class LogLevel : uint8_t { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Off = 5 };

std::string_view to_string(LogLevel l) noexcept;
std::optional<LogLevel> parse_log_level(std::string_view s) noexcept;

void set_log_level(LogLevel l) noexcept;
LogLevel log_level() noexcept;
bool log_enabled(LogLevel l) noexcept;

// One JSON object per line: level, component, message, timestamp plus `fields`.
// Warn and above go to stderr.
void log(LogLevel level, std::string_view component, std::string_view message,
         const Json::Value& fields = Json::Value{});

inline void log_debug(std::string_view component, std::string_view message,
                      const Json::Value& fields = Json::Value{}) {
  log(LogLevel::Debug, component, message, fields);
}

inline void log_info(std::string_view component, std::string_view message,
                     const Json::Value& fields = Json::Value{}) {
  log(LogLevel::Info, component, message, fields);
}

inline void log_warn(std::string_view component, std::string_view message,
                     const Json::Value& fields = Json::Value{}) {
  log(LogLevel::Warn, component, message, fields);
}

inline void log_error(std::string_view component, std::string_view message,
                      const Json::Value& fields = Json::Value{}) {
  log(LogLevel::Error, component, message, fields);
}

std::string now_iso8601();

} // namespace bgame
