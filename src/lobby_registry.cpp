#include "bgame/lobby_registry.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "bgame/log.hpp"

namespace bgame {

namespace {

Status lobby_not_found(LobbyId id) {
  return Status::error(ErrorKind::NotFound, "lobby " + std::to_string(id) + " not found");
}

Json::Value lobby_fields(LobbyId id) {
  Json::Value fields;
  fields["lobby"] = static_cast<Json::UInt64>(id);
  return fields;
}

} // namespace

LobbyRegistry::LobbyRegistry(SnapshotStore& store, std::size_t backlog_per_player)
  : store_(store), backlog_per_player_(std::max<std::size_t>(backlog_per_player, 1)) {}

std::shared_ptr<LobbyRegistry::LiveLobby> LobbyRegistry::find_(LobbyId id) const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  const auto it = lobbies_.find(id);
  if (it == lobbies_.end()) return nullptr;
  return it->second;
}

std::shared_ptr<LobbyRegistry::LiveLobby> LobbyRegistry::make_live_(const Lobby& lobby) const {
  const auto seats = static_cast<std::size_t>(std::max<int32_t>(lobby.max_players, 1));
  auto live = std::make_shared<LiveLobby>(lobby.id, store_, seats * backlog_per_player_);
  live->lobby = lobby;
  return live;
}

Status LobbyRegistry::rehydrate() {
  auto stored = store_.list_lobbies();
  if (!stored.ok()) return stored.status;

  std::size_t resumed = 0;
  std::unordered_map<LobbyId, std::shared_ptr<LiveLobby>> loaded;

  for (const Lobby& lobby : stored.value) {
    auto live = make_live_(lobby);

    if (lobby.started) {
      auto latest = store_.latest_snapshot(lobby.id);
      if (!latest.ok()) return latest.status;

      if (!latest.value) {
        Json::Value fields = lobby_fields(lobby.id);
        log_warn("registry", "started lobby has no snapshot, left idle", fields);
        live->lobby.started = false;
      } else if (Status st = live->session.restore(lobby, *latest.value); !st.ok()) {
        return st;
      } else {
        ++resumed;
      }
    }
    loaded.emplace(lobby.id, std::move(live));
  }

  {
    std::unique_lock<std::shared_mutex> lk(mu_);
    for (auto& [id, live] : loaded) lobbies_.insert_or_assign(id, std::move(live));
  }

  Json::Value fields;
  fields["lobbies"] = static_cast<Json::UInt64>(stored.value.size());
  fields["resumed"] = static_cast<Json::UInt64>(resumed);
  log_info("registry", "rehydrated", fields);
  return Status::success();
}

Status LobbyRegistry::create_lobby(const Lobby& lobby) {
  if (lobby.id == 0) return Status::error(ErrorKind::BadRequest, "lobby id must be non-zero");
  if (lobby.max_players <= 0) return Status::error(ErrorKind::BadRequest, "max_players must be positive");

  Lobby record = lobby;
  record.started = false;

  std::unique_lock<std::shared_mutex> lk(mu_);
  if (lobbies_.count(record.id) != 0) {
    return Status::error(ErrorKind::BadRequest, "lobby " + std::to_string(record.id) + " already exists");
  }
  if (Status st = store_.save_lobby(record); !st.ok()) return st;

  lobbies_.emplace(record.id, make_live_(record));
  log_info("registry", "lobby created", lobby_fields(record.id));
  return Status::success();
}

Status LobbyRegistry::remove_lobby(LobbyId id) {
  auto live = find_(id);
  if (!live) return lobby_not_found(id);

  {
    std::lock_guard<std::mutex> lk(live->mu);
    if (Status st = store_.delete_lobby(id); !st.ok()) return st;
    live->bus.publish(KickAll{});
    live->bus.close();
    live->session.reset();
  }

  {
    std::unique_lock<std::shared_mutex> lk(mu_);
    lobbies_.erase(id);
  }
  log_info("registry", "lobby removed", lobby_fields(id));
  return Status::success();
}

Status LobbyRegistry::start_game(LobbyId id, const std::vector<PlayerId>& roster,
                                 const std::map<PlayerId, ClassId>& classes) {
  auto live = find_(id);
  if (!live) return lobby_not_found(id);

  std::lock_guard<std::mutex> lk(live->mu);
  if (static_cast<int64_t>(roster.size()) > live->lobby.max_players) {
    return Status::error(ErrorKind::BadRequest, "roster exceeds " + std::to_string(live->lobby.max_players) +
                                                    " players");
  }

  // no explicit assignment: use the one stored on the lobby
  const auto& assignment = classes.empty() ? live->lobby.player_classes : classes;
  if (Status st = live->session.start_new_game(live->lobby, roster, assignment); !st.ok()) return st;

  live->lobby = live->session.lobby();
  return Status::success();
}

Status LobbyRegistry::submit_round_end(LobbyId id, PlayerId player, Value quantity) {
  auto live = find_(id);
  if (!live) return lobby_not_found(id);

  std::lock_guard<std::mutex> lk(live->mu);
  Status st = live->session.submit_round_end(player, quantity);
  if (live->session.phase() != GamePhase::NotStarted) {
    // events may have replaced the settings
    live->lobby.settings = live->session.lobby().settings;
  }
  return st;
}

Status LobbyRegistry::update_player_classes(LobbyId id, const std::map<PlayerId, ClassId>& classes) {
  auto live = find_(id);
  if (!live) return lobby_not_found(id);

  std::lock_guard<std::mutex> lk(live->mu);
  if (live->lobby.started) {
    return Status::error(ErrorKind::LobbyStarted, "classes are fixed once the game started");
  }

  Lobby updated = live->lobby;
  updated.player_classes = classes;
  if (Status st = store_.save_lobby(updated); !st.ok()) return st;

  live->lobby = std::move(updated);
  live->bus.publish(ClassesUpdated{classes});
  return Status::success();
}

Status LobbyRegistry::stop_game(LobbyId id) {
  auto live = find_(id);
  if (!live) return lobby_not_found(id);

  std::lock_guard<std::mutex> lk(live->mu);
  if (!live->lobby.started) return Status::error(ErrorKind::LobbyNotStarted, "game not started");
  if (Status st = store_.set_lobby_started(id, false); !st.ok()) return st;

  live->session.reset();
  live->lobby.started = false;
  live->bus.publish(KickAll{});
  log_info("registry", "game stopped", lobby_fields(id));
  return Status::success();
}

Status LobbyRegistry::disconnect_player(LobbyId id, PlayerId player) {
  auto live = find_(id);
  if (!live) return lobby_not_found(id);

  std::lock_guard<std::mutex> lk(live->mu);
  live->bus.publish(PlayerDisconnected{player});
  return Status::success();
}

Outcome<std::shared_ptr<Subscription>> LobbyRegistry::subscribe(LobbyId id) {
  using Result = Outcome<std::shared_ptr<Subscription>>;
  auto live = find_(id);
  if (!live) return Result::failure(lobby_not_found(id));
  return Result::success(live->bus.subscribe());
}

Outcome<PlayerStats> LobbyRegistry::player_stats(LobbyId id, const std::vector<StatKind>& kinds) {
  if (!find_(id)) return Outcome<PlayerStats>::failure(lobby_not_found(id));

  auto rows = store_.all_snapshots(id);
  if (!rows.ok()) return Outcome<PlayerStats>::failure(rows.status);
  if (rows.value.empty()) {
    return Outcome<PlayerStats>::failure(Status::error(ErrorKind::LobbyNotStarted, "lobby has never been started"));
  }
  return Outcome<PlayerStats>::success(collect_player_stats(rows.value, kinds));
}

Outcome<LobbyView> LobbyRegistry::view(LobbyId id) const {
  auto live = find_(id);
  if (!live) return Outcome<LobbyView>::failure(lobby_not_found(id));

  std::lock_guard<std::mutex> lk(live->mu);
  LobbyView v{};
  v.lobby = live->lobby;
  v.phase = live->session.phase();
  v.state = live->session.state();
  return Outcome<LobbyView>::success(std::move(v));
}

std::size_t LobbyRegistry::lobby_count() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  return lobbies_.size();
}

} // namespace bgame
