#pragma once
#include <map>
#include <vector>

#include "bgame/status.hpp"
#include "bgame/types.hpp"

namespace bgame {

// Supplier -> customer chain for one game. Goods travel first_player -> ...
// -> last_player; external supply enters at first_player and external demand
// is placed on last_player.
struct Flow {
  std::map<PlayerId, PlayerId> flow{};   // player -> next player (kNoPlayer after the last)
  PlayerId first_player{kNoPlayer};
  PlayerId last_player{kNoPlayer};

  // Player shipping to `p` (kNoPlayer for the first player)
  PlayerId sender_of(PlayerId p) const noexcept;

  // Player `p` ships to (kNoPlayer for the last one); NotFound outside the chain
  Outcome<PlayerId> recipient_of(PlayerId p) const;

  bool contains(PlayerId p) const noexcept { return flow.find(p) != flow.end(); }

  friend bool operator==(const Flow&, const Flow&) = default;
};

// Chain in roster order; an empty roster is a configuration error.
Outcome<Flow> build_flow(const std::vector<PlayerId>& roster);

} // namespace bgame
