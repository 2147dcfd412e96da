#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <variant>
#include "model/Snapshot.hpp"

namespace glance::app {

struct ToggleRequested {};
struct CloseRequested {};
struct SnapshotReady { glance::model::Snapshot snapshot; };
struct ShutdownRequested {};

using UiEvent = std::variant<ToggleRequested, CloseRequested, SnapshotReady, ShutdownRequested>;

// Bounded multi-producer queue drained by the UI-owning loop. Posting never
// blocks: when the queue is full the event is dropped.
class EventQueue {
public:
  static constexpr std::size_t kCapacity = 64;

  explicit EventQueue(std::size_t capacity = kCapacity) : capacity_(capacity) {}

  // False when the event was dropped because the queue is full.
  bool post(UiEvent ev);

  std::optional<UiEvent> try_pop();
  std::optional<UiEvent> wait_pop(std::chrono::milliseconds timeout);

  std::size_t size() const;
  std::size_t dropped() const;

private:
  const std::size_t capacity_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<UiEvent> q_;
  std::size_t dropped_{0};
};

} // namespace glance::app
