#pragma once
#include <map>

#include "bgame/flow.hpp"
#include "bgame/order.hpp"
#include "bgame/player_state.hpp"
#include "bgame/settings.hpp"
#include "bgame/types.hpp"

namespace bgame {

// Authoritative live state of one game
struct RoundState {
  Round   round{0};
  int64_t players{0};
  int64_t players_finished{0};

  PlayerStates users_states{};
  OrderMap round_orders{};   // orders placed this round, keyed by the ordering player
  OrderMap send_orders{};    // shipments made this round, keyed by the shipping player
  std::map<PlayerId, ClassId> player_classes{};

  Settings settings{};
  Flow flow{};
  Value demand{0};
  Value supply{0};

  bool round_complete() const noexcept { return players > 0 && players_finished == players; }

  friend bool operator==(const RoundState&, const RoundState&) = default;
};

} // namespace bgame
