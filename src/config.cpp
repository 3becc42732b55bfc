#include "bgame/config.hpp"

#include <charconv>
#include <cstdlib>
#include <string_view>

namespace bgame {

namespace {

template <class T>
bool parse_number(std::string_view s, T& out) {
  const auto* first = s.data();
  const auto* last = s.data() + s.size();
  const auto res = std::from_chars(first, last, out);
  return res.ec == std::errc{} && res.ptr == last;
}

Status bad_value(std::string_view name, std::string_view value) {
  return Status::error(ErrorKind::BadRequest,
                       std::string(name) + ": invalid value '" + std::string(value) + "'");
}

} // namespace

Outcome<ServerConfig> config_from_env(ServerConfig base) {
  if (const char* v = std::getenv("BGAME_PORT")) {
    if (!parse_number(v, base.port) || base.port <= 0 || base.port > 65535) {
      return Outcome<ServerConfig>::failure(bad_value("BGAME_PORT", v));
    }
  }
  if (const char* v = std::getenv("BGAME_DATABASE")) {
    if (*v == '\0') return Outcome<ServerConfig>::failure(bad_value("BGAME_DATABASE", v));
    base.database_path = v;
  }
  if (const char* v = std::getenv("BGAME_LOG_LEVEL")) {
    const auto lvl = parse_log_level(v);
    if (!lvl) return Outcome<ServerConfig>::failure(bad_value("BGAME_LOG_LEVEL", v));
    base.log_level = *lvl;
  }
  if (const char* v = std::getenv("BGAME_BACKLOG_PER_PLAYER")) {
    if (!parse_number(v, base.backlog_per_player) || base.backlog_per_player == 0) {
      return Outcome<ServerConfig>::failure(bad_value("BGAME_BACKLOG_PER_PLAYER", v));
    }
  }
  return Outcome<ServerConfig>::success(std::move(base));
}

Outcome<ServerConfig> apply_args(ServerConfig cfg, int argc, char** argv) {
  if (argc > 1) {
    if (!parse_number(std::string_view(argv[1]), cfg.port) || cfg.port <= 0 || cfg.port > 65535) {
      return Outcome<ServerConfig>::failure(bad_value("port", argv[1]));
    }
  }
  if (argc > 2) cfg.database_path = argv[2];
  return Outcome<ServerConfig>::success(std::move(cfg));
}

} // namespace bgame
