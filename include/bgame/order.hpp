#pragma once
#include <map>

#include "bgame/types.hpp"

namespace bgame {

struct Order {
  PlayerId recipient{kNoPlayer};
  PlayerId sender{kNoPlayer};
  Value    value{};
  Value    cost{};

  friend bool operator==(const Order&, const Order&) = default;
};

// Orders of one round keyed by the player that produced them (kNoPlayer for
// the synthesized demand/supply order)
using OrderMap = std::map<PlayerId, Order>;

} // namespace bgame
