#include "bgame/poll_listeners.hpp"

#include "bgame/log.hpp"

namespace bgame {

PollListeners::PollListeners(LobbyRegistry& registry, Clock::duration idle)
    : registry_(registry), idle_(idle) {}

Outcome<std::shared_ptr<Subscription>> PollListeners::get(LobbyId lobby, PlayerId player) {
  using Result = Outcome<std::shared_ptr<Subscription>>;

  std::lock_guard<std::mutex> lk(mu_);
  const auto now = Clock::now();
  evict_idle_locked_(now);

  const auto key = std::make_pair(lobby, player);
  if (const auto it = subs_.find(key); it != subs_.end()) {
    it->second.last_poll = now;
    return Result::success(it->second.sub);
  }
  auto sub = registry_.subscribe(lobby);
  if (!sub.ok()) return sub;
  subs_.insert_or_assign(key, Entry{sub.value, now});
  return sub;
}

void PollListeners::drop(LobbyId lobby, PlayerId player) {
  std::lock_guard<std::mutex> lk(mu_);
  subs_.erase(std::make_pair(lobby, player));
}

std::size_t PollListeners::evict_idle(Clock::time_point now) {
  std::lock_guard<std::mutex> lk(mu_);
  return evict_idle_locked_(now);
}

std::size_t PollListeners::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return subs_.size();
}

std::size_t PollListeners::evict_idle_locked_(Clock::time_point now) {
  std::size_t evicted = 0;
  for (auto it = subs_.begin(); it != subs_.end();) {
    if (now - it->second.last_poll > idle_ || it->second.sub->closed()) {
      it = subs_.erase(it);
      ++evicted;
    } else {
      ++it;
    }
  }
  if (evicted > 0) {
    Json::Value fields;
    fields["evicted"] = static_cast<Json::UInt64>(evicted);
    fields["remaining"] = static_cast<Json::UInt64>(subs_.size());
    log_debug("listeners", "idle listeners dropped", fields);
  }
  return evicted;
}

} // namespace bgame
