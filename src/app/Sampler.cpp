#include "app/Sampler.hpp"
#include "util/Log.hpp"

#include <exception>

using namespace std::chrono;

namespace glance::app {

Sampler::Sampler(glance::collectors::ISnapshotCollector& collector, Callback on_snapshot,
                 milliseconds interval)
  : collector_(collector), on_snapshot_(std::move(on_snapshot)), interval_(interval) {}

Sampler::~Sampler() { stop(); }

void Sampler::start() {
  if (thread_.joinable()) return;
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
}

void Sampler::stop() {
  if (!thread_.joinable()) return;
  thread_.request_stop();
  thread_.join();
}

void Sampler::tick() {
  try {
    auto snap = collector_.collect();
    snap.seq = ++seq_;
    if (on_snapshot_) on_snapshot_(snap);
  } catch (const std::exception& e) {
    GLANCE_LOG_ERROR("sampling tick failed: %s", e.what());
  } catch (...) {
    GLANCE_LOG_ERROR("sampling tick failed: unknown exception");
  }
  ticks_.fetch_add(1);
}

void Sampler::run(std::stop_token st) {
  auto next_due = steady_clock::now();
  while (!st.stop_requested()) {
    tick();
    next_due += interval_;
    auto now = steady_clock::now();
    if (next_due <= now) {
      auto missed = static_cast<uint64_t>((now - next_due) / interval_) + 1;
      skipped_.fetch_add(missed);
      next_due += interval_ * static_cast<long long>(missed);
      GLANCE_LOG_DEBUG("sampling tick overran; skipped %llu tick(s)", static_cast<unsigned long long>(missed));
    }
    std::unique_lock lk(mu_);
    // Returns early when stop is requested
    cv_.wait_until(lk, st, next_due, []{ return false; });
  }
}

} // namespace glance::app
