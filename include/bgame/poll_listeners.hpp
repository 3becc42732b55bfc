#pragma once
#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <utility>

#include "bgame/broadcast.hpp"
#include "bgame/lobby_registry.hpp"
#include "bgame/status.hpp"
#include "bgame/types.hpp"

namespace bgame {

// One subscription per (lobby, player) that long-polls; kept between requests so
// nothing published between two polls is lost. Entries nobody polled for longer
// than the idle limit, or whose bus closed, are dropped on the next lookup.
class PollListeners {
public:
  using Clock = std::chrono::steady_clock;

  static constexpr std::chrono::minutes kDefaultIdle{5};

  explicit PollListeners(LobbyRegistry& registry, Clock::duration idle = kDefaultIdle);

  // Existing subscription of the pair, or a fresh one at the bus tail
  Outcome<std::shared_ptr<Subscription>> get(LobbyId lobby, PlayerId player);
  void drop(LobbyId lobby, PlayerId player);

  // Returns how many entries were dropped
  std::size_t evict_idle(Clock::time_point now);

  std::size_t size() const;

private:
  struct Entry {
    std::shared_ptr<Subscription> sub;
    Clock::time_point last_poll;
  };

  std::size_t evict_idle_locked_(Clock::time_point now);

  LobbyRegistry& registry_;
  Clock::duration idle_;
  mutable std::mutex mu_;
  std::map<std::pair<LobbyId, PlayerId>, Entry> subs_;
};

} // namespace bgame
