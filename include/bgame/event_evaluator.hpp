#pragma once
#include <optional>
#include <vector>

#include "bgame/game_event.hpp"
#include "bgame/messages.hpp"
#include "bgame/player_state.hpp"
#include "bgame/round_state.hpp"
#include "bgame/snapshot_store.hpp"
#include "bgame/status.hpp"

namespace bgame {

struct ConditionResult {
  bool met{false};
  std::vector<PlayerId> targets{};
};

// ---- pure condition checks ----
ConditionResult evaluate_round_met(const RoundState& rs, Round round);
ConditionResult evaluate_value_exceed(const PlayerStates& players, Resource resource, MetBy met_by, Value value);
ConditionResult evaluate_single_change(const PlayerStates& current, const PlayerStates& prior,
                                       Resource resource, Value value);

// Runs a lobby's events against its just-advanced round state. Broadcasts are
// appended to `out` in the order they are produced.
class EventEvaluator {
public:
  EventEvaluator(LobbyId lobby, SnapshotStore& store) : lobby_(lobby), store_(store) {}

  // SingleChange reads the row of round - 1
  Outcome<ConditionResult> evaluate(const EventCondition& cond, const RoundState& rs);

  // Applies the actions of every event whose condition holds. An event whose
  // condition or action fails is reported in `out` and the pass continues.
  // Returns the number of events that fired.
  std::size_t run(const std::vector<GameEvent>& events, RoundState& rs, Settings* lobby_settings,
                  std::vector<LobbyEvent>& out);

  Status apply(const EventAction& action, const std::vector<PlayerId>& targets, RoundState& rs,
               Settings* lobby_settings, std::vector<LobbyEvent>& out);

private:
  LobbyId lobby_;
  SnapshotStore& store_;
};

} // namespace bgame
