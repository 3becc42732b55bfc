#pragma once
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "bgame/lobby.hpp"
#include "bgame/settings.hpp"
#include "bgame/snapshot.hpp"
#include "bgame/status.hpp"

struct sqlite3;

namespace bgame {

// Durable lobby records plus the append-only per-round `game_state` rows
class SnapshotStore {
public:
  virtual ~SnapshotStore() = default;

  // ---- lobby records ----
  virtual Status save_lobby(const Lobby& lobby) = 0;   // insert or replace
  virtual Outcome<Lobby> get_lobby(LobbyId id) = 0;
  virtual Outcome<std::vector<Lobby>> list_lobbies() = 0;
  virtual Status delete_lobby(LobbyId id) = 0;
  virtual Status update_lobby_settings(LobbyId id, const Settings& settings) = 0;
  virtual Status set_lobby_started(LobbyId id, bool started) = 0;

  // ---- snapshots ----
  virtual Status append_snapshot(const GameStateRow& row) = 0;

  // Round-0 row and lobby.started=1 in one transaction; rows of a previous game
  // of the same lobby are dropped first.
  virtual Status begin_game(const GameStateRow& round0) = 0;

  virtual Outcome<std::optional<GameStateRow>> latest_snapshot(LobbyId id) = 0;
  virtual Outcome<std::optional<GameStateRow>> snapshot_at(LobbyId id, Round round) = 0;
  virtual Outcome<std::vector<GameStateRow>> all_snapshots(LobbyId id) = 0;   // ordered by round
};

class SqliteSnapshotStore final : public SnapshotStore {
public:
  // ":memory:" gives a private in-memory database
  static Outcome<std::unique_ptr<SqliteSnapshotStore>> open(const std::string& path);

  ~SqliteSnapshotStore() override;

  SqliteSnapshotStore(const SqliteSnapshotStore&) = delete;
  SqliteSnapshotStore& operator=(const SqliteSnapshotStore&) = delete;

  Status save_lobby(const Lobby& lobby) override;
  Outcome<Lobby> get_lobby(LobbyId id) override;
  Outcome<std::vector<Lobby>> list_lobbies() override;
  Status delete_lobby(LobbyId id) override;
  Status update_lobby_settings(LobbyId id, const Settings& settings) override;
  Status set_lobby_started(LobbyId id, bool started) override;

  Status append_snapshot(const GameStateRow& row) override;
  Status begin_game(const GameStateRow& round0) override;
  Outcome<std::optional<GameStateRow>> latest_snapshot(LobbyId id) override;
  Outcome<std::optional<GameStateRow>> snapshot_at(LobbyId id, Round round) override;
  Outcome<std::vector<GameStateRow>> all_snapshots(LobbyId id) override;

private:
  explicit SqliteSnapshotStore(sqlite3* db) noexcept : db_(db) {}

  Status exec_(const char* sql);
  Status migrate_();
  Status insert_snapshot_locked_(const GameStateRow& row);
  Outcome<std::vector<GameStateRow>> query_snapshots_locked_(LobbyId id, std::optional<Round> round, bool latest_only);
  Status error_(const char* what) const;

  // one connection, serialized
  mutable std::mutex mu_;
  sqlite3* db_{nullptr};
};

} // namespace bgame
