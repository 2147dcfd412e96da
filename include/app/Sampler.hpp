#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <stop_token>
#include <thread>
#include "collectors/SystemCollector.hpp"

namespace glance::app {

// Periodic sampling on a dedicated thread. One tick at a time; a tick that
// overruns its slot causes the missed slots to be skipped, never queued.
class Sampler {
public:
  using Callback = std::function<void(const glance::model::Snapshot&)>;
  static constexpr std::chrono::milliseconds kSampleInterval{2000};

  Sampler(glance::collectors::ISnapshotCollector& collector, Callback on_snapshot,
          std::chrono::milliseconds interval = kSampleInterval);
  ~Sampler();

  Sampler(const Sampler&) = delete;
  Sampler& operator=(const Sampler&) = delete;

  // First tick runs immediately. No-op when already running.
  void start();
  // Wakes the thread and joins it. Idempotent; safe before start().
  void stop();

  bool running() const { return thread_.joinable(); }
  uint64_t ticks() const { return ticks_.load(); }
  uint64_t skipped_ticks() const { return skipped_.load(); }

private:
  void run(std::stop_token st);
  void tick();

  glance::collectors::ISnapshotCollector& collector_;
  Callback on_snapshot_;
  const std::chrono::milliseconds interval_;
  std::mutex mu_;
  std::condition_variable_any cv_;
  std::atomic<uint64_t> ticks_{0};
  std::atomic<uint64_t> skipped_{0};
  uint64_t seq_{0};
  std::jthread thread_{};
};

} // namespace glance::app
