#pragma once
#include <functional>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace glance::app {

// Modifier and key state for the fixed Ctrl+Shift+M combination, fed with
// evdev EV_KEY (code, value) pairs. value: 0 release, 1 press, 2 auto-repeat.
class ComboTracker {
public:
  // True exactly when this event completes the combination.
  bool on_key(unsigned code, int value);
  // Forget all held keys (after SYN_DROPPED).
  void reset();

private:
  bool ctrl_l_{false}, ctrl_r_{false};
  bool shift_l_{false}, shift_r_{false};
  bool m_down_{false};
};

// Global hotkey listener over Linux input devices (/dev/input/event*).
class HotkeyWatcher {
public:
  using Callback = std::function<void()>;

  // Empty `device`: every event node that reports KEY_M.
  explicit HotkeyWatcher(std::string device = {}) : device_(std::move(device)) {}
  ~HotkeyWatcher();

  HotkeyWatcher(const HotkeyWatcher&) = delete;
  HotkeyWatcher& operator=(const HotkeyWatcher&) = delete;

  // Opens the devices and starts the watcher thread. `cb` runs on that
  // thread. Returns false when no device could be opened.
  bool start(Callback cb);
  void stop();

  std::size_t device_count() const { return fds_.size(); }

private:
  void run(std::stop_token st);
  bool open_devices();
  void close_devices();

  std::string device_;
  Callback cb_;
  std::vector<int> fds_;
  int wake_fd_{-1};
  std::jthread thread_{};
};

} // namespace glance::app
