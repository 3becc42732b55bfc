#pragma once
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "bgame/broadcast.hpp"
#include "bgame/game_session.hpp"
#include "bgame/lobby.hpp"
#include "bgame/snapshot_store.hpp"
#include "bgame/stats.hpp"
#include "bgame/status.hpp"

namespace bgame {

struct LobbyView {
  Lobby lobby{};
  GamePhase phase{GamePhase::NotStarted};
  RoundState state{};
};

// Process-wide set of live lobbies. Owned by whoever wires the server and
// handed to the command handlers; tests build their own.
class LobbyRegistry {
public:
  explicit LobbyRegistry(SnapshotStore& store, std::size_t backlog_per_player = 8);

  LobbyRegistry(const LobbyRegistry&) = delete;
  LobbyRegistry& operator=(const LobbyRegistry&) = delete;

  // Load every stored lobby; started ones are rebuilt from their latest snapshot.
  // Run once before serving traffic.
  Status rehydrate();

  Status create_lobby(const Lobby& lobby);
  Status remove_lobby(LobbyId id);

  Status start_game(LobbyId id, const std::vector<PlayerId>& roster,
                    const std::map<PlayerId, ClassId>& classes);
  Status submit_round_end(LobbyId id, PlayerId player, Value quantity);
  Status update_player_classes(LobbyId id, const std::map<PlayerId, ClassId>& classes);
  Status stop_game(LobbyId id);
  Status disconnect_player(LobbyId id, PlayerId player);

  Outcome<std::shared_ptr<Subscription>> subscribe(LobbyId id);
  Outcome<PlayerStats> player_stats(LobbyId id, const std::vector<StatKind>& kinds);
  Outcome<LobbyView> view(LobbyId id) const;

  std::size_t lobby_count() const;

private:
  struct LiveLobby {
    LiveLobby(LobbyId id, SnapshotStore& store, std::size_t backlog)
      : bus(backlog), session(id, store, bus) {}

    std::mutex mu;   // held for a whole command, round transitions included
    Lobby lobby{};
    BroadcastBus bus;
    GameSession session;
  };

  std::shared_ptr<LiveLobby> find_(LobbyId id) const;
  std::shared_ptr<LiveLobby> make_live_(const Lobby& lobby) const;

  SnapshotStore& store_;
  std::size_t backlog_per_player_{8};

  mutable std::shared_mutex mu_;
  std::unordered_map<LobbyId, std::shared_ptr<LiveLobby>> lobbies_;
};

} // namespace bgame
