#pragma once
#include <cstdint>
#include <map>
#include <vector>

#include "bgame/broadcast.hpp"
#include "bgame/event_evaluator.hpp"
#include "bgame/lobby.hpp"
#include "bgame/messages.hpp"
#include "bgame/round_state.hpp"
#include "bgame/snapshot_store.hpp"
#include "bgame/status.hpp"

namespace bgame {

enum class GamePhase : uint8_t { NotStarted = 0, Active = 1, Finished = 2 };

std::string_view to_string(GamePhase p) noexcept;

// Round state machine of one lobby. Not thread-safe: the registry serializes
// every call under the lobby's mutex.
class GameSession {
public:
  GameSession(LobbyId id, SnapshotStore& store, BroadcastBus& bus);

  GameSession(const GameSession&) = delete;
  GameSession& operator=(const GameSession&) = delete;

  Status start_new_game(const Lobby& lobby, const std::vector<PlayerId>& roster,
                        const std::map<PlayerId, ClassId>& classes);

  // One player's end-of-round order. The last submission of a round drives the
  // whole transition (snapshot, events, broadcasts) before returning.
  Status submit_round_end(PlayerId player, Value quantity);

  // Rebuild live state from the latest persisted row (process restart)
  Status restore(const Lobby& lobby, const GameStateRow& latest);

  // Drop live state; snapshots stay in the store
  void reset();

  GamePhase phase() const noexcept { return phase_; }
  const RoundState& state() const noexcept { return state_; }
  const Lobby& lobby() const noexcept { return lobby_; }
  bool has_submitted(PlayerId player) const noexcept;

private:
  // Steps up to and including the snapshot write, on a working copy. The event
  // pass for the new round runs here so its effects are part of the row;
  // settings changes land in lobby_settings and are committed by the caller.
  Status advance_round_(RoundState& next, Settings& lobby_settings, std::vector<LobbyEvent>& out);

  // After the snapshot is durable
  void new_round_();
  void finish_game_();

  void publish_(std::vector<LobbyEvent>& out);
  void publish_(LobbyEvent ev);

  GameUpdate make_update_(const RoundState& rs, const OrderMap& round_orders, const OrderMap& send_orders) const;

  LobbyId id_;
  SnapshotStore& store_;
  BroadcastBus& bus_;
  EventEvaluator evaluator_;

  Lobby lobby_{};
  RoundState state_{};
  GamePhase phase_{GamePhase::NotStarted};
};

} // namespace bgame
