#include "app/HotkeyWatcher.hpp"
#include "util/Log.hpp"
#include "util/Procfs.hpp"

#include <fcntl.h>
#include <linux/input.h>
#include <poll.h>
#include <sys/eventfd.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>

namespace glance::app {

bool ComboTracker::on_key(unsigned code, int value) {
  if (value == 2) return false; // auto-repeat never fires
  const bool down = (value == 1);
  switch (code) {
    case KEY_LEFTCTRL:   ctrl_l_ = down; return false;
    case KEY_RIGHTCTRL:  ctrl_r_ = down; return false;
    case KEY_LEFTSHIFT:  shift_l_ = down; return false;
    case KEY_RIGHTSHIFT: shift_r_ = down; return false;
    case KEY_M:
      if (!down) { m_down_ = false; return false; }
      if (m_down_) return false;
      m_down_ = true;
      return (ctrl_l_ || ctrl_r_) && (shift_l_ || shift_r_);
    default:
      return false;
  }
}

void ComboTracker::reset() { *this = ComboTracker{}; }

static bool test_bit(const unsigned long* bits, unsigned bit) {
  constexpr unsigned kBitsPerLong = sizeof(unsigned long) * 8;
  return (bits[bit / kBitsPerLong] >> (bit % kBitsPerLong)) & 1UL;
}

static bool reports_key_m(int fd) {
  unsigned long bits[(KEY_MAX + 1) / (sizeof(unsigned long) * 8) + 1]{};
  if (::ioctl(fd, EVIOCGBIT(EV_KEY, sizeof(bits)), bits) < 0) return false;
  return test_bit(bits, KEY_M);
}

HotkeyWatcher::~HotkeyWatcher() { stop(); }

bool HotkeyWatcher::open_devices() {
  std::vector<std::string> paths;
  if (!device_.empty()) {
    paths.push_back(device_);
  } else {
    for (auto& e : glance::util::list_dir("/dev/input")) {
      if (e.rfind("event", 0) == 0) paths.push_back("/dev/input/" + e);
    }
    std::sort(paths.begin(), paths.end());
  }
  int denied = 0;
  for (const auto& p : paths) {
    int fd = ::open(p.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) {
      if (errno == EACCES || errno == EPERM) ++denied;
      GLANCE_LOG_DEBUG("hotkey: cannot open %s: %s", p.c_str(), std::strerror(errno));
      continue;
    }
    if (!reports_key_m(fd)) { ::close(fd); continue; }
    GLANCE_LOG_DEBUG("hotkey: watching %s", p.c_str());
    fds_.push_back(fd);
  }
  if (fds_.empty()) {
    if (denied > 0) {
      GLANCE_LOG_ONCE(glance::util::LogLevel::Warn, "hotkey-register",
                      "hotkey unavailable: permission denied on %d input device(s); "
                      "add your user to the 'input' group", denied);
    } else {
      GLANCE_LOG_ONCE(glance::util::LogLevel::Warn, "hotkey-register",
                      "hotkey unavailable: no keyboard input device found");
    }
    return false;
  }
  return true;
}

void HotkeyWatcher::close_devices() {
  for (int fd : fds_) ::close(fd);
  fds_.clear();
  if (wake_fd_ >= 0) { ::close(wake_fd_); wake_fd_ = -1; }
}

bool HotkeyWatcher::start(Callback cb) {
  if (thread_.joinable()) return true;
  if (!open_devices()) return false;
  wake_fd_ = ::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
  if (wake_fd_ < 0) {
    GLANCE_LOG_ERROR("hotkey: eventfd() failed: %s", std::strerror(errno));
    close_devices();
    return false;
  }
  cb_ = std::move(cb);
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
  return true;
}

void HotkeyWatcher::stop() {
  if (thread_.joinable()) {
    thread_.request_stop();
    uint64_t one = 1;
    if (::write(wake_fd_, &one, sizeof(one)) < 0) {
      GLANCE_LOG_DEBUG("hotkey: wake write failed: %s", std::strerror(errno));
    }
    thread_.join();
  }
  close_devices();
}

void HotkeyWatcher::run(std::stop_token st) {
  std::vector<ComboTracker> trackers(fds_.size());
  std::vector<pollfd> pfds;
  pfds.push_back(pollfd{wake_fd_, POLLIN, 0});
  for (int fd : fds_) pfds.push_back(pollfd{fd, POLLIN, 0});

  while (!st.stop_requested()) {
    int pr = ::poll(pfds.data(), pfds.size(), -1);
    if (pr < 0) {
      if (errno == EINTR) continue;
      GLANCE_LOG_ERROR("hotkey: poll failed: %s", std::strerror(errno));
      return;
    }
    if (pfds[0].revents) return; // stop()
    for (std::size_t i = 1; i < pfds.size(); ++i) {
      auto& p = pfds[i];
      if (p.fd < 0 || !p.revents) continue;
      if (p.revents & (POLLERR | POLLHUP | POLLNVAL)) {
        // Unplugged keyboard
        GLANCE_LOG_INFO("hotkey: input device went away");
        p.fd = -1;
        continue;
      }
      input_event evs[64];
      for (;;) {
        ssize_t n = ::read(p.fd, evs, sizeof(evs));
        if (n <= 0) break;
        auto count = static_cast<std::size_t>(n) / sizeof(input_event);
        for (std::size_t k = 0; k < count; ++k) {
          const auto& ev = evs[k];
          if (ev.type == EV_SYN && ev.code == SYN_DROPPED) { trackers[i - 1].reset(); continue; }
          if (ev.type != EV_KEY) continue;
          if (trackers[i - 1].on_key(ev.code, ev.value) && cb_) cb_();
        }
      }
    }
  }
}

} // namespace glance::app
