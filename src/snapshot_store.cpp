#include "bgame/snapshot_store.hpp"

#include <sqlite3.h>

#include <string>
#include <utility>

#include "bgame/log.hpp"
#include "bgame/serialization.hpp"

namespace bgame {

namespace {

struct StmtDeleter {
  void operator()(sqlite3_stmt* s) const noexcept { sqlite3_finalize(s); }
};
using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

constexpr const char* kSchema = R"sql(
CREATE TABLE IF NOT EXISTS lobby (
  id             INTEGER PRIMARY KEY,
  name           TEXT    NOT NULL,
  max_players    INTEGER NOT NULL,
  owner_id       INTEGER NOT NULL,
  started        INTEGER NOT NULL DEFAULT 0,
  settings       TEXT    NOT NULL,
  events         TEXT    NOT NULL,
  player_classes TEXT    NOT NULL
);
CREATE TABLE IF NOT EXISTS game_state (
  id              INTEGER PRIMARY KEY AUTOINCREMENT,
  lobby_id        INTEGER NOT NULL,
  round           INTEGER NOT NULL,
  user_states     TEXT    NOT NULL,
  round_orders    TEXT    NOT NULL,
  send_orders     TEXT    NOT NULL,
  players_classes TEXT    NOT NULL,
  flow            TEXT    NOT NULL,
  demand          INTEGER NOT NULL,
  supply          INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS game_state_lobby_round ON game_state (lobby_id, round);
)sql";

constexpr const char* kSnapshotColumns =
    "SELECT lobby_id, round, user_states, round_orders, send_orders, players_classes, flow, demand, supply "
    "FROM game_state ";

sqlite3_int64 as_db_id(uint64_t id) noexcept { return static_cast<sqlite3_int64>(id); }

std::string column_text(sqlite3_stmt* s, int col) {
  const auto* p = sqlite3_column_text(s, col);
  if (p == nullptr) return {};
  return std::string(reinterpret_cast<const char*>(p), static_cast<std::size_t>(sqlite3_column_bytes(s, col)));
}

bool bind_text(sqlite3_stmt* s, int idx, const std::string& text) {
  return sqlite3_bind_text(s, idx, text.data(), static_cast<int>(text.size()), SQLITE_TRANSIENT) == SQLITE_OK;
}

// Stored JSON that no longer decodes is a storage fault, not a client one
template <class T, class Fn>
Outcome<T> decode_column(const std::string& text, const char* column, Fn&& fn) {
  auto r = decode_json<T>(text, std::forward<Fn>(fn));
  if (!r.ok()) {
    return Outcome<T>::failure(
        Status::error(ErrorKind::Persistence, std::string("corrupt ") + column + ": " + r.status.detail));
  }
  return r;
}

void rollback(sqlite3* db) {
  char* err = nullptr;
  if (sqlite3_exec(db, "ROLLBACK", nullptr, nullptr, &err) != SQLITE_OK) {
    Json::Value fields;
    fields["error"] = err ? err : "unknown error";
    log_error("store", "rollback failed", fields);
  }
  sqlite3_free(err);
}

} // namespace

Outcome<std::unique_ptr<SqliteSnapshotStore>> SqliteSnapshotStore::open(const std::string& path) {
  using Result = Outcome<std::unique_ptr<SqliteSnapshotStore>>;

  sqlite3* db = nullptr;
  const int rc = sqlite3_open_v2(path.c_str(), &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                                 nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
    sqlite3_close(db);
    return Result::failure(Status::error(ErrorKind::Persistence, "open " + path + ": " + msg));
  }

  std::unique_ptr<SqliteSnapshotStore> store(new SqliteSnapshotStore(db));
  if (Status st = store->migrate_(); !st.ok()) return Result::failure(std::move(st));

  Json::Value fields;
  fields["path"] = path;
  log_debug("store", "database opened", fields);
  return Result::success(std::move(store));
}

SqliteSnapshotStore::~SqliteSnapshotStore() {
  if (db_) sqlite3_close(db_);
}

Status SqliteSnapshotStore::error_(const char* what) const {
  return Status::error(ErrorKind::Persistence, std::string(what) + ": " + sqlite3_errmsg(db_));
}

Status SqliteSnapshotStore::exec_(const char* sql) {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "unknown error";
    sqlite3_free(err);
    return Status::error(ErrorKind::Persistence, msg);
  }
  return Status::success();
}

Status SqliteSnapshotStore::migrate_() {
  std::lock_guard<std::mutex> lk(mu_);
  if (Status st = exec_("PRAGMA foreign_keys = ON;"); !st.ok()) return st;
  return exec_(kSchema);
}

// ---------------- lobby records ----------------

Status SqliteSnapshotStore::save_lobby(const Lobby& lobby) {
  std::lock_guard<std::mutex> lk(mu_);

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db_,
                         "INSERT OR REPLACE INTO lobby (id, name, max_players, owner_id, started, settings, events, "
                         "player_classes) VALUES (?, ?, ?, ?, ?, ?, ?, ?)",
                         -1, &raw, nullptr) != SQLITE_OK) {
    return error_("prepare save_lobby");
  }
  Stmt stmt(raw);

  const std::string settings = dump_json(to_json(lobby.settings));
  const std::string events = dump_json(to_json(lobby.events));
  const std::string classes = dump_json(to_json(lobby.player_classes));

  sqlite3_bind_int64(raw, 1, as_db_id(lobby.id));
  if (!bind_text(raw, 2, lobby.name)) return error_("bind name");
  sqlite3_bind_int(raw, 3, lobby.max_players);
  sqlite3_bind_int64(raw, 4, as_db_id(lobby.owner_id));
  sqlite3_bind_int(raw, 5, lobby.started ? 1 : 0);
  if (!bind_text(raw, 6, settings) || !bind_text(raw, 7, events) || !bind_text(raw, 8, classes)) {
    return error_("bind lobby json");
  }

  if (sqlite3_step(raw) != SQLITE_DONE) return error_("save_lobby");
  return Status::success();
}

namespace {

Outcome<Lobby> read_lobby(sqlite3_stmt* s) {
  Lobby l{};
  l.id = static_cast<LobbyId>(sqlite3_column_int64(s, 0));
  l.name = column_text(s, 1);
  l.max_players = sqlite3_column_int(s, 2);
  l.owner_id = static_cast<PlayerId>(sqlite3_column_int64(s, 3));
  l.started = sqlite3_column_int(s, 4) != 0;

  auto settings = decode_column<Settings>(column_text(s, 5), "lobby.settings", settings_from_json);
  if (!settings.ok()) return Outcome<Lobby>::failure(settings.status);
  auto events = decode_column<std::vector<GameEvent>>(column_text(s, 6), "lobby.events", events_from_json);
  if (!events.ok()) return Outcome<Lobby>::failure(events.status);
  auto classes =
      decode_column<std::map<PlayerId, ClassId>>(column_text(s, 7), "lobby.player_classes", classes_from_json);
  if (!classes.ok()) return Outcome<Lobby>::failure(classes.status);

  l.settings = std::move(settings.value);
  l.events = std::move(events.value);
  l.player_classes = std::move(classes.value);
  return Outcome<Lobby>::success(std::move(l));
}

constexpr const char* kLobbyColumns =
    "SELECT id, name, max_players, owner_id, started, settings, events, player_classes FROM lobby ";

} // namespace

Outcome<Lobby> SqliteSnapshotStore::get_lobby(LobbyId id) {
  std::lock_guard<std::mutex> lk(mu_);

  sqlite3_stmt* raw = nullptr;
  const std::string sql = std::string(kLobbyColumns) + "WHERE id = ?";
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
    return Outcome<Lobby>::failure(error_("prepare get_lobby"));
  }
  Stmt stmt(raw);
  sqlite3_bind_int64(raw, 1, as_db_id(id));

  const int rc = sqlite3_step(raw);
  if (rc == SQLITE_DONE) {
    return Outcome<Lobby>::failure(Status::error(ErrorKind::NotFound, "lobby " + std::to_string(id) + " not found"));
  }
  if (rc != SQLITE_ROW) return Outcome<Lobby>::failure(error_("get_lobby"));
  return read_lobby(raw);
}

Outcome<std::vector<Lobby>> SqliteSnapshotStore::list_lobbies() {
  using Result = Outcome<std::vector<Lobby>>;
  std::lock_guard<std::mutex> lk(mu_);

  sqlite3_stmt* raw = nullptr;
  const std::string sql = std::string(kLobbyColumns) + "ORDER BY id";
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
    return Result::failure(error_("prepare list_lobbies"));
  }
  Stmt stmt(raw);

  std::vector<Lobby> out;
  for (;;) {
    const int rc = sqlite3_step(raw);
    if (rc == SQLITE_DONE) break;
    if (rc != SQLITE_ROW) return Result::failure(error_("list_lobbies"));
    auto l = read_lobby(raw);
    if (!l.ok()) return Result::failure(l.status);
    out.push_back(std::move(l.value));
  }
  return Result::success(std::move(out));
}

Status SqliteSnapshotStore::delete_lobby(LobbyId id) {
  std::lock_guard<std::mutex> lk(mu_);

  if (Status st = exec_("BEGIN IMMEDIATE"); !st.ok()) return st;

  for (const char* sql : {"DELETE FROM game_state WHERE lobby_id = ?", "DELETE FROM lobby WHERE id = ?"}) {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &raw, nullptr) != SQLITE_OK) {
      Status st = error_("prepare delete_lobby");
      rollback(db_);
      return st;
    }
    Stmt stmt(raw);
    sqlite3_bind_int64(raw, 1, as_db_id(id));
    if (sqlite3_step(raw) != SQLITE_DONE) {
      Status st = error_("delete_lobby");
      rollback(db_);
      return st;
    }
  }

  return exec_("COMMIT");
}

Status SqliteSnapshotStore::update_lobby_settings(LobbyId id, const Settings& settings) {
  std::lock_guard<std::mutex> lk(mu_);

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db_, "UPDATE lobby SET settings = ? WHERE id = ?", -1, &raw, nullptr) != SQLITE_OK) {
    return error_("prepare update_lobby_settings");
  }
  Stmt stmt(raw);

  if (!bind_text(raw, 1, dump_json(to_json(settings)))) return error_("bind settings");
  sqlite3_bind_int64(raw, 2, as_db_id(id));

  if (sqlite3_step(raw) != SQLITE_DONE) return error_("update_lobby_settings");
  if (sqlite3_changes(db_) == 0) {
    return Status::error(ErrorKind::NotFound, "lobby " + std::to_string(id) + " not found");
  }
  return Status::success();
}

Status SqliteSnapshotStore::set_lobby_started(LobbyId id, bool started) {
  std::lock_guard<std::mutex> lk(mu_);

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db_, "UPDATE lobby SET started = ? WHERE id = ?", -1, &raw, nullptr) != SQLITE_OK) {
    return error_("prepare set_lobby_started");
  }
  Stmt stmt(raw);
  sqlite3_bind_int(raw, 1, started ? 1 : 0);
  sqlite3_bind_int64(raw, 2, as_db_id(id));

  if (sqlite3_step(raw) != SQLITE_DONE) return error_("set_lobby_started");
  if (sqlite3_changes(db_) == 0) {
    return Status::error(ErrorKind::NotFound, "lobby " + std::to_string(id) + " not found");
  }
  return Status::success();
}

// ---------------- snapshots ----------------

Status SqliteSnapshotStore::insert_snapshot_locked_(const GameStateRow& row) {
  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db_,
                         "INSERT INTO game_state (lobby_id, round, user_states, round_orders, send_orders, "
                         "players_classes, flow, demand, supply) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)",
                         -1, &raw, nullptr) != SQLITE_OK) {
    return error_("prepare append_snapshot");
  }
  Stmt stmt(raw);

  sqlite3_bind_int64(raw, 1, as_db_id(row.lobby));
  sqlite3_bind_int64(raw, 2, row.round);
  const bool bound = bind_text(raw, 3, dump_json(to_json(row.user_states))) &&
                     bind_text(raw, 4, dump_json(to_json(row.round_orders))) &&
                     bind_text(raw, 5, dump_json(to_json(row.send_orders))) &&
                     bind_text(raw, 6, dump_json(to_json(row.player_classes))) &&
                     bind_text(raw, 7, dump_json(to_json(row.flow)));
  if (!bound) return error_("bind snapshot json");
  sqlite3_bind_int64(raw, 8, row.demand);
  sqlite3_bind_int64(raw, 9, row.supply);

  if (sqlite3_step(raw) != SQLITE_DONE) return error_("append_snapshot");
  return Status::success();
}

Status SqliteSnapshotStore::append_snapshot(const GameStateRow& row) {
  std::lock_guard<std::mutex> lk(mu_);
  return insert_snapshot_locked_(row);
}

Status SqliteSnapshotStore::begin_game(const GameStateRow& round0) {
  std::lock_guard<std::mutex> lk(mu_);

  if (Status st = exec_("BEGIN IMMEDIATE"); !st.ok()) return st;

  auto fail = [this](Status st) {
    rollback(db_);
    return st;
  };

  {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, "DELETE FROM game_state WHERE lobby_id = ?", -1, &raw, nullptr) != SQLITE_OK) {
      return fail(error_("prepare clear snapshots"));
    }
    Stmt stmt(raw);
    sqlite3_bind_int64(raw, 1, as_db_id(round0.lobby));
    if (sqlite3_step(raw) != SQLITE_DONE) return fail(error_("clear snapshots"));
  }

  if (Status st = insert_snapshot_locked_(round0); !st.ok()) return fail(std::move(st));

  {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, "UPDATE lobby SET started = 1 WHERE id = ?", -1, &raw, nullptr) != SQLITE_OK) {
      return fail(error_("prepare mark started"));
    }
    Stmt stmt(raw);
    sqlite3_bind_int64(raw, 1, as_db_id(round0.lobby));
    if (sqlite3_step(raw) != SQLITE_DONE) return fail(error_("mark started"));
    if (sqlite3_changes(db_) == 0) {
      return fail(Status::error(ErrorKind::NotFound, "lobby " + std::to_string(round0.lobby) + " not found"));
    }
  }

  if (Status st = exec_("COMMIT"); !st.ok()) return fail(std::move(st));
  return Status::success();
}

Outcome<std::vector<GameStateRow>> SqliteSnapshotStore::query_snapshots_locked_(LobbyId id, std::optional<Round> round,
                                                                                bool latest_only) {
  using Result = Outcome<std::vector<GameStateRow>>;

  std::string sql = kSnapshotColumns;
  if (round) {
    sql += "WHERE lobby_id = ? AND round = ? ORDER BY id DESC LIMIT 1";
  } else if (latest_only) {
    sql += "WHERE lobby_id = ? ORDER BY round DESC, id DESC LIMIT 1";
  } else {
    sql += "WHERE lobby_id = ? ORDER BY round ASC, id ASC";
  }

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
    return Result::failure(error_("prepare snapshot query"));
  }
  Stmt stmt(raw);
  sqlite3_bind_int64(raw, 1, as_db_id(id));
  if (round) sqlite3_bind_int64(raw, 2, *round);

  std::vector<GameStateRow> rows;
  for (;;) {
    const int rc = sqlite3_step(raw);
    if (rc == SQLITE_DONE) break;
    if (rc != SQLITE_ROW) return Result::failure(error_("snapshot query"));

    GameStateRow row{};
    row.lobby = static_cast<LobbyId>(sqlite3_column_int64(raw, 0));
    row.round = sqlite3_column_int64(raw, 1);

    auto states = decode_column<PlayerStates>(column_text(raw, 2), "game_state.user_states", player_states_from_json);
    if (!states.ok()) return Result::failure(states.status);
    auto round_orders = decode_column<OrderMap>(column_text(raw, 3), "game_state.round_orders", order_map_from_json);
    if (!round_orders.ok()) return Result::failure(round_orders.status);
    auto send_orders = decode_column<OrderMap>(column_text(raw, 4), "game_state.send_orders", order_map_from_json);
    if (!send_orders.ok()) return Result::failure(send_orders.status);
    auto classes = decode_column<std::map<PlayerId, ClassId>>(column_text(raw, 5), "game_state.players_classes",
                                                              classes_from_json);
    if (!classes.ok()) return Result::failure(classes.status);
    auto flow = decode_column<Flow>(column_text(raw, 6), "game_state.flow", flow_from_json);
    if (!flow.ok()) return Result::failure(flow.status);

    row.user_states = std::move(states.value);
    row.round_orders = std::move(round_orders.value);
    row.send_orders = std::move(send_orders.value);
    row.player_classes = std::move(classes.value);
    row.flow = std::move(flow.value);
    row.demand = sqlite3_column_int64(raw, 7);
    row.supply = sqlite3_column_int64(raw, 8);
    rows.push_back(std::move(row));
  }
  return Result::success(std::move(rows));
}

Outcome<std::optional<GameStateRow>> SqliteSnapshotStore::latest_snapshot(LobbyId id) {
  using Result = Outcome<std::optional<GameStateRow>>;
  std::lock_guard<std::mutex> lk(mu_);

  auto rows = query_snapshots_locked_(id, std::nullopt, true);
  if (!rows.ok()) return Result::failure(rows.status);
  if (rows.value.empty()) return Result::success(std::nullopt);
  return Result::success(std::move(rows.value.front()));
}

Outcome<std::optional<GameStateRow>> SqliteSnapshotStore::snapshot_at(LobbyId id, Round round) {
  using Result = Outcome<std::optional<GameStateRow>>;
  std::lock_guard<std::mutex> lk(mu_);

  auto rows = query_snapshots_locked_(id, round, false);
  if (!rows.ok()) return Result::failure(rows.status);
  if (rows.value.empty()) return Result::success(std::nullopt);
  return Result::success(std::move(rows.value.front()));
}

Outcome<std::vector<GameStateRow>> SqliteSnapshotStore::all_snapshots(LobbyId id) {
  std::lock_guard<std::mutex> lk(mu_);
  return query_snapshots_locked_(id, std::nullopt, false);
}

} // namespace bgame
