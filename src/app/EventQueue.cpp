#include "app/EventQueue.hpp"
#include "util/Log.hpp"

namespace glance::app {

bool EventQueue::post(UiEvent ev) {
  {
    std::lock_guard lk(mu_);
    if (q_.size() >= capacity_) {
      ++dropped_;
      GLANCE_LOG_DEBUG("event queue full (%zu); dropping event %zu", capacity_, ev.index());
      return false;
    }
    q_.push_back(std::move(ev));
  }
  cv_.notify_one();
  return true;
}

std::optional<UiEvent> EventQueue::try_pop() {
  std::lock_guard lk(mu_);
  if (q_.empty()) return std::nullopt;
  UiEvent ev = std::move(q_.front());
  q_.pop_front();
  return ev;
}

std::optional<UiEvent> EventQueue::wait_pop(std::chrono::milliseconds timeout) {
  std::unique_lock lk(mu_);
  if (!cv_.wait_for(lk, timeout, [this]{ return !q_.empty(); })) return std::nullopt;
  UiEvent ev = std::move(q_.front());
  q_.pop_front();
  return ev;
}

std::size_t EventQueue::size() const {
  std::lock_guard lk(mu_);
  return q_.size();
}

std::size_t EventQueue::dropped() const {
  std::lock_guard lk(mu_);
  return dropped_;
}

} // namespace glance::app
