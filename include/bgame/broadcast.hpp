#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>

#include "bgame/messages.hpp"

namespace bgame {

namespace detail {
struct BusCore;
}

// Receiving end of a BroadcastBus. Only events published after subscribe() are
// seen; a reader that falls further behind than the backlog skips ahead.
class Subscription {
public:
  explicit Subscription(std::shared_ptr<detail::BusCore> core);
  ~Subscription();

  Subscription(const Subscription&) = delete;
  Subscription& operator=(const Subscription&) = delete;

  std::optional<LobbyEvent> try_next();
  std::optional<LobbyEvent> wait_next(std::chrono::milliseconds timeout);

  // Events dropped because this reader lagged
  uint64_t missed() const noexcept { return missed_; }
  bool closed() const;

private:
  std::optional<LobbyEvent> take_locked_();

  std::shared_ptr<detail::BusCore> core_;
  uint64_t cursor_{0};
  uint64_t missed_{0};
};

// Multi-subscriber, bounded, best-effort fan-out for one lobby
class BroadcastBus {
public:
  explicit BroadcastBus(std::size_t capacity);
  ~BroadcastBus();

  BroadcastBus(const BroadcastBus&) = delete;
  BroadcastBus& operator=(const BroadcastBus&) = delete;

  // Returns the number of subscribers alive at publish time (0 = nobody heard it)
  std::size_t publish(LobbyEvent ev);

  std::shared_ptr<Subscription> subscribe();

  // Wakes waiting readers; later publishes are dropped
  void close();

  std::size_t subscriber_count() const;
  std::size_t capacity() const noexcept { return capacity_; }

private:
  std::shared_ptr<detail::BusCore> core_;
  std::size_t capacity_{1};
};

namespace detail {
struct BusCore {
  mutable std::mutex mu;
  std::condition_variable cv;
  std::deque<LobbyEvent> backlog;   // backlog.front() has sequence number front_seq
  uint64_t front_seq{0};
  uint64_t next_seq{0};
  std::size_t capacity{1};
  std::size_t subscribers{0};
  bool closed{false};
};
} // namespace detail

} // namespace bgame
