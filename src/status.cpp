#include "bgame/status.hpp"

namespace bgame {

std::string_view to_string(ErrorKind k) noexcept {
  switch (k) {
    case ErrorKind::None: return "None";
    case ErrorKind::BadRequest: return "BadRequest";
    case ErrorKind::NotFound: return "NotFound";
    case ErrorKind::InsufficientFunds: return "InsufficientFunds";
    case ErrorKind::AlreadySubmitted: return "AlreadySubmitted";
    case ErrorKind::LobbyStarted: return "LobbyStarted";
    case ErrorKind::LobbyNotStarted: return "LobbyNotStarted";
    case ErrorKind::GameFinished: return "GameFinished";
    case ErrorKind::Internal: return "Internal";
    case ErrorKind::Persistence: return "Persistence";
  }
  return "Unknown";
}

std::string describe(const Status& s) {
  if (s.ok()) return "ok";
  std::string out{to_string(s.kind)};
  if (!s.detail.empty()) {
    out += ": ";
    out += s.detail;
  }
  return out;
}

} // namespace bgame
