#include "bgame/messages.hpp"

#include <type_traits>

namespace bgame {

std::string_view to_string(LobbyEventType t) noexcept {
  switch (t) {
    case LobbyEventType::GameStarted: return "GameStart";
    case LobbyEventType::RoundStarted: return "RoundStart";
    case LobbyEventType::RoundEnded: return "RoundFinish";
    case LobbyEventType::SettingsChanged: return "GameEventSettingsChange";
    case LobbyEventType::PopUp: return "GameEventPopUp";
    case LobbyEventType::ResourceGranted: return "GameEventResource";
    case LobbyEventType::SubmissionAck: return "Ack";
    case LobbyEventType::PlayerError: return "Error";
    case LobbyEventType::LobbyError: return "Error";
    case LobbyEventType::GameEnded: return "GameEnd";
    case LobbyEventType::ClassesUpdated: return "UpdateClasses";
    case LobbyEventType::KickAll: return "KickAll";
    case LobbyEventType::PlayerDisconnected: return "UserDisconnected";
  }
  return "Unknown";
}

bool visible_to(const LobbyEvent& e, PlayerId player) noexcept {
  return std::visit([&](const auto& x) -> bool {
    using T = std::decay_t<decltype(x)>;

    if constexpr (std::is_same_v<T, PopUp> || std::is_same_v<T, ResourceGranted>) {
      return !x.target || *x.target == player;
    } else if constexpr (std::is_same_v<T, SubmissionAck> || std::is_same_v<T, PlayerError>) {
      return x.player == player;
    } else {
      return true;
    }
  }, e);
}

} // namespace bgame
