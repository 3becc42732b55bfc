#pragma once
#include <map>

#include "bgame/flow.hpp"
#include "bgame/order.hpp"
#include "bgame/player_state.hpp"
#include "bgame/round_state.hpp"
#include "bgame/types.hpp"

namespace bgame {

// One persisted `game_state` row: the full state right after a round boundary
struct GameStateRow {
  LobbyId lobby{};
  Round round{};
  PlayerStates user_states{};
  OrderMap round_orders{};
  OrderMap send_orders{};
  std::map<PlayerId, ClassId> player_classes{};
  Flow flow{};
  Value demand{};
  Value supply{};

  friend bool operator==(const GameStateRow&, const GameStateRow&) = default;
};

GameStateRow make_snapshot(LobbyId lobby, const RoundState& rs);

// Live state rebuilt from a row; settings come from the lobby record and the
// finished counter restarts at zero (rows are only written at round boundaries)
RoundState restore_round_state(const GameStateRow& row, const Settings& settings);

} // namespace bgame
