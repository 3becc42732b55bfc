#pragma once
#include <map>
#include <string>
#include <vector>

#include "bgame/game_event.hpp"
#include "bgame/settings.hpp"
#include "bgame/types.hpp"

namespace bgame {

// Durable lobby record as seen by the engine
struct Lobby {
  LobbyId id{};
  std::string name{};
  int32_t max_players{0};
  PlayerId owner_id{kNoPlayer};
  bool started{false};

  Settings settings{};
  std::vector<GameEvent> events{};                 // evaluated in this order
  std::map<PlayerId, ClassId> player_classes{};    // pre-start assignment

  friend bool operator==(const Lobby&, const Lobby&) = default;
};

} // namespace bgame
