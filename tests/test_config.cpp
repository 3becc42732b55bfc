#include <gtest/gtest.h>

#include <cstdlib>

#include "bgame/config.hpp"
#include "bgame/log.hpp"

namespace {

void clear_env() {
  for (const char* name : {"BGAME_PORT", "BGAME_DATABASE", "BGAME_LOG_LEVEL", "BGAME_BACKLOG_PER_PLAYER"}) {
    ::unsetenv(name);
  }
}

} // namespace

TEST(Config, DefaultsWhenEnvironmentIsEmpty) {
  clear_env();
  auto cfg = bgame::config_from_env();
  ASSERT_TRUE(cfg.ok());
  EXPECT_EQ(cfg.value.port, 3000);
  EXPECT_EQ(cfg.value.database_path, "bgame.db");
  EXPECT_EQ(cfg.value.log_level, bgame::LogLevel::Info);
  EXPECT_EQ(cfg.value.backlog_per_player, 8u);
}

TEST(Config, EnvironmentOverridesDefaults) {
  clear_env();
  ::setenv("BGAME_PORT", "8081", 1);
  ::setenv("BGAME_DATABASE", "/tmp/games.db", 1);
  ::setenv("BGAME_LOG_LEVEL", "debug", 1);
  ::setenv("BGAME_BACKLOG_PER_PLAYER", "16", 1);

  auto cfg = bgame::config_from_env();
  clear_env();
  ASSERT_TRUE(cfg.ok()) << bgame::describe(cfg.status);
  EXPECT_EQ(cfg.value.port, 8081);
  EXPECT_EQ(cfg.value.database_path, "/tmp/games.db");
  EXPECT_EQ(cfg.value.log_level, bgame::LogLevel::Debug);
  EXPECT_EQ(cfg.value.backlog_per_player, 16u);
}

TEST(Config, MalformedEnvironmentIsRejected) {
  clear_env();
  ::setenv("BGAME_PORT", "80x", 1);
  auto bad_port = bgame::config_from_env();
  clear_env();
  EXPECT_EQ(bad_port.status.kind, bgame::ErrorKind::BadRequest);

  ::setenv("BGAME_LOG_LEVEL", "chatty", 1);
  auto bad_level = bgame::config_from_env();
  clear_env();
  EXPECT_EQ(bad_level.status.kind, bgame::ErrorKind::BadRequest);

  ::setenv("BGAME_BACKLOG_PER_PLAYER", "0", 1);
  auto bad_backlog = bgame::config_from_env();
  clear_env();
  EXPECT_EQ(bad_backlog.status.kind, bgame::ErrorKind::BadRequest);
}

TEST(Config, PositionalArgumentsWin) {
  char prog[] = "bgame_gateway";
  char port[] = "9000";
  char db[] = "other.db";
  char* argv[] = {prog, port, db};

  auto cfg = bgame::apply_args(bgame::ServerConfig{}, 3, argv);
  ASSERT_TRUE(cfg.ok());
  EXPECT_EQ(cfg.value.port, 9000);
  EXPECT_EQ(cfg.value.database_path, "other.db");

  char bad[] = "port";
  char* argv_bad[] = {prog, bad};
  EXPECT_FALSE(bgame::apply_args(bgame::ServerConfig{}, 2, argv_bad).ok());
}

TEST(Config, LogLevelNames) {
  EXPECT_EQ(bgame::parse_log_level("warn"), bgame::LogLevel::Warn);
  EXPECT_EQ(bgame::parse_log_level("error"), bgame::LogLevel::Error);
  EXPECT_FALSE(bgame::parse_log_level("loud").has_value());

  const auto saved = bgame::log_level();
  bgame::set_log_level(bgame::LogLevel::Warn);
  EXPECT_FALSE(bgame::log_enabled(bgame::LogLevel::Info));
  EXPECT_TRUE(bgame::log_enabled(bgame::LogLevel::Error));
  bgame::set_log_level(saved);
}
