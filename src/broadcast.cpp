#include "bgame/broadcast.hpp"

#include <algorithm>

namespace bgame {

Subscription::Subscription(std::shared_ptr<detail::BusCore> core) : core_(std::move(core)) {
  std::lock_guard<std::mutex> lk(core_->mu);
  cursor_ = core_->next_seq;
  ++core_->subscribers;
}

Subscription::~Subscription() {
  std::lock_guard<std::mutex> lk(core_->mu);
  --core_->subscribers;
}

std::optional<LobbyEvent> Subscription::take_locked_() {
  auto& c = *core_;
  if (cursor_ < c.front_seq) {
    // lagged past the backlog: skip to the oldest event still held
    missed_ += c.front_seq - cursor_;
    cursor_ = c.front_seq;
  }
  if (cursor_ >= c.next_seq) return std::nullopt;

  LobbyEvent ev = c.backlog[static_cast<std::size_t>(cursor_ - c.front_seq)];
  ++cursor_;
  return ev;
}

std::optional<LobbyEvent> Subscription::try_next() {
  std::lock_guard<std::mutex> lk(core_->mu);
  return take_locked_();
}

std::optional<LobbyEvent> Subscription::wait_next(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lk(core_->mu);
  core_->cv.wait_for(lk, timeout, [&] { return core_->closed || cursor_ < core_->next_seq; });
  return take_locked_();
}

bool Subscription::closed() const {
  std::lock_guard<std::mutex> lk(core_->mu);
  return core_->closed && cursor_ >= core_->next_seq;
}

BroadcastBus::BroadcastBus(std::size_t capacity)
  : core_(std::make_shared<detail::BusCore>()), capacity_(std::max<std::size_t>(capacity, 1)) {
  core_->capacity = capacity_;
}

BroadcastBus::~BroadcastBus() {
  close();
}

std::size_t BroadcastBus::publish(LobbyEvent ev) {
  std::size_t receivers = 0;
  {
    std::lock_guard<std::mutex> lk(core_->mu);
    if (core_->closed || core_->subscribers == 0) return 0;

    core_->backlog.push_back(std::move(ev));
    ++core_->next_seq;
    while (core_->backlog.size() > core_->capacity) {
      core_->backlog.pop_front();
      ++core_->front_seq;
    }
    receivers = core_->subscribers;
  }
  core_->cv.notify_all();
  return receivers;
}

std::shared_ptr<Subscription> BroadcastBus::subscribe() {
  return std::make_shared<Subscription>(core_);
}

void BroadcastBus::close() {
  {
    std::lock_guard<std::mutex> lk(core_->mu);
    core_->closed = true;
  }
  core_->cv.notify_all();
}

std::size_t BroadcastBus::subscriber_count() const {
  std::lock_guard<std::mutex> lk(core_->mu);
  return core_->subscribers;
}

} // namespace bgame
