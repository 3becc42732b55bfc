#pragma once
#include <deque>
#include <map>
#include <vector>

#include "bgame/order.hpp"
#include "bgame/types.hpp"

namespace bgame {

struct PlayerState {
  PlayerId player_id{kNoPlayer};

  Value money{};
  Value spent_money{};
  Value magazine_state{};
  Value performance{};
  Value back_order_sum{};

  std::deque<Order> incoming_orders{};    // shipments on their way, oldest first
  std::deque<Order> requested_orders{};   // orders this player must fulfil, oldest first
  std::vector<Order> sent_orders{};       // shipment history

  Order placed_order{};
  Order received_order{};

  friend bool operator==(const PlayerState&, const PlayerState&) = default;
};

using PlayerStates = std::map<PlayerId, PlayerState>;

// Single mapping from Resource to ledger field, shared by conditions and actions
using ResourceMember = Value PlayerState::*;

inline constexpr ResourceMember resource_member(Resource r) noexcept {
  switch (r) {
    case Resource::Money: return &PlayerState::money;
    case Resource::MagazineState: return &PlayerState::magazine_state;
    case Resource::Performance: return &PlayerState::performance;
    case Resource::BackOrderValue: return &PlayerState::back_order_sum;
  }
  return &PlayerState::money;
}

inline Value& resource_field(PlayerState& s, Resource r) noexcept { return s.*resource_member(r); }
inline Value resource_value(const PlayerState& s, Resource r) noexcept { return s.*resource_member(r); }

} // namespace bgame
