#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

#include "bgame/log.hpp"
#include "bgame/status.hpp"

namespace bgame {

struct ServerConfig {
  int port{3000};
  std::string database_path{"bgame.db"};
  LogLevel log_level{LogLevel::Info};

  // Broadcast backlog per lobby = max_players * backlog_per_player
  std::size_t backlog_per_player{8};

  // Long-poll wait for /events
  int64_t events_wait_ms{25'000};
};

// Reads BGAME_PORT, BGAME_DATABASE, BGAME_LOG_LEVEL, BGAME_BACKLOG_PER_PLAYER;
// unset variables keep the defaults, malformed ones are a BadRequest.
Outcome<ServerConfig> config_from_env(ServerConfig base = {});

// Positional overrides: [port] [database]
Outcome<ServerConfig> apply_args(ServerConfig cfg, int argc, char** argv);

} // namespace bgame
