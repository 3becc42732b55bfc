#include "bgame/flow.hpp"

#include <set>
#include <string>

namespace bgame {

PlayerId Flow::sender_of(PlayerId p) const noexcept {
  if (p == kNoPlayer) return kNoPlayer;
  for (const auto& [from, to] : flow) {
    if (to == p) return from;
  }
  return kNoPlayer;
}

Outcome<PlayerId> Flow::recipient_of(PlayerId p) const {
  const auto it = flow.find(p);
  if (it == flow.end()) {
    return Outcome<PlayerId>::failure(
        Status::error(ErrorKind::NotFound, "bad flow, no recipient for player " + std::to_string(p)));
  }
  return Outcome<PlayerId>::success(it->second);
}

Outcome<Flow> build_flow(const std::vector<PlayerId>& roster) {
  if (roster.empty()) {
    return Outcome<Flow>::failure(Status::error(ErrorKind::BadRequest, "empty roster"));
  }

  std::set<PlayerId> seen;
  Flow f{};
  f.first_player = roster.front();
  f.last_player = roster.back();

  for (std::size_t i = 0; i < roster.size(); ++i) {
    const PlayerId cur = roster[i];
    if (cur == kNoPlayer) {
      return Outcome<Flow>::failure(Status::error(ErrorKind::BadRequest, "roster contains the nil player"));
    }
    if (!seen.insert(cur).second) {
      return Outcome<Flow>::failure(
          Status::error(ErrorKind::BadRequest, "player " + std::to_string(cur) + " listed twice"));
    }
    const PlayerId next = (i + 1 < roster.size()) ? roster[i + 1] : kNoPlayer;
    f.flow.emplace(cur, next);
  }

  return Outcome<Flow>::success(std::move(f));
}

} // namespace bgame
