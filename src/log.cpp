#include "bgame/log.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace bgame {

namespace {

std::atomic<LogLevel> g_level{LogLevel::Info};
std::mutex g_out_mtx;

Json::StreamWriterBuilder make_writer() {
  Json::StreamWriterBuilder b;
  b["indentation"] = "";
  return b;
}

} // namespace

std::string_view to_string(LogLevel l) noexcept {
  switch (l) {
    case LogLevel::Trace: return "trace";
    case LogLevel::Debug: return "debug";
    case LogLevel::Info: return "info";
    case LogLevel::Warn: return "warn";
    case LogLevel::Error: return "error";
    case LogLevel::Off: return "off";
  }
  return "info";
}

std::optional<LogLevel> parse_log_level(std::string_view s) noexcept {
  if (s == "trace") return LogLevel::Trace;
  if (s == "debug") return LogLevel::Debug;
  if (s == "info") return LogLevel::Info;
  if (s == "warn" || s == "warning") return LogLevel::Warn;
  if (s == "error") return LogLevel::Error;
  if (s == "off") return LogLevel::Off;
  return std::nullopt;
}

void set_log_level(LogLevel l) noexcept { g_level.store(l, std::memory_order_relaxed); }

LogLevel log_level() noexcept { return g_level.load(std::memory_order_relaxed); }

bool log_enabled(LogLevel l) noexcept {
  return l != LogLevel::Off && static_cast<uint8_t>(l) >= static_cast<uint8_t>(log_level());
}

std::string now_iso8601() {
  const auto now = std::chrono::system_clock::now();
  const auto t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  gmtime_r(&t, &tm);
  std::ostringstream ss;
  ss << std::put_time(&tm, "%FT%TZ");
  return ss.str();
}

void log(LogLevel level, std::string_view component, std::string_view message, const Json::Value& fields) {
  if (!log_enabled(level)) return;

  Json::Value entry(Json::objectValue);
  entry["level"] = std::string(to_string(level));
  entry["component"] = std::string(component);
  entry["message"] = std::string(message);
  entry["timestamp"] = now_iso8601();
  if (fields.isObject()) {
    for (const auto& key : fields.getMemberNames()) entry[key] = fields[key];
  }

  static const Json::StreamWriterBuilder writer = make_writer();
  const std::string line = Json::writeString(writer, entry);

  std::lock_guard<std::mutex> lk(g_out_mtx);
  if (level >= LogLevel::Warn) std::cerr << line << '\n';
  else std::cout << line << '\n';
}

} // namespace bgame
