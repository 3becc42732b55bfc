#pragma once
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "bgame/flow.hpp"
#include "bgame/order.hpp"
#include "bgame/player_state.hpp"
#include "bgame/settings.hpp"
#include "bgame/stats.hpp"
#include "bgame/status.hpp"
#include "bgame/types.hpp"

namespace bgame {

// Full state pushed at game start and at every round start
struct GameUpdate {
  PlayerStates player_states{};
  Round round{};
  Flow flow{};
  Settings settings{};
  OrderMap round_orders{};
  OrderMap send_orders{};
  std::map<PlayerId, ClassId> player_classes{};
};

struct GameEnd {
  PlayerStates player_states{};
  PlayerStats stats{};
};

struct GameStarted { GameUpdate update{}; };
struct RoundStarted { GameUpdate update{}; };
struct RoundEnded {};
struct SettingsChanged { Settings settings{}; };

// target == nullopt: whole lobby
struct PopUp {
  std::optional<PlayerId> target{};
  std::string message{};
};

struct ResourceGranted {
  std::optional<PlayerId> target{};
  Resource resource{Resource::Money};
  Value value{};
};

struct SubmissionAck { PlayerId player{kNoPlayer}; };
struct PlayerError { PlayerId player{kNoPlayer}; Status error{}; };
struct LobbyError { Status error{}; };
struct GameEnded { GameEnd end{}; };
struct ClassesUpdated { std::map<PlayerId, ClassId> classes{}; };
struct KickAll {};
struct PlayerDisconnected { PlayerId player{kNoPlayer}; };

using LobbyEvent = std::variant<GameStarted, RoundStarted, RoundEnded, SettingsChanged, PopUp,
                                ResourceGranted, SubmissionAck, PlayerError, LobbyError, GameEnded,
                                ClassesUpdated, KickAll, PlayerDisconnected>;

enum class LobbyEventType : uint8_t {
  GameStarted, RoundStarted, RoundEnded, SettingsChanged, PopUp, ResourceGranted,
  SubmissionAck, PlayerError, LobbyError, GameEnded, ClassesUpdated, KickAll, PlayerDisconnected
};

inline LobbyEventType type_of(const LobbyEvent& e) noexcept {
  return static_cast<LobbyEventType>(e.index()); // relies on variant order above
}

std::string_view to_string(LobbyEventType t) noexcept;

// Player-addressed events are only delivered to their addressee
bool visible_to(const LobbyEvent& e, PlayerId player) noexcept;

} // namespace bgame
