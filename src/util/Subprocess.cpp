#include "util/Subprocess.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

extern char** environ;

using namespace std::chrono;

namespace glance::util {

namespace {

// Closes both pipe ends on scope exit unless released.
struct PipeFds {
  int rd{-1};
  int wr{-1};
  ~PipeFds() {
    if (rd >= 0) ::close(rd);
    if (wr >= 0) ::close(wr);
  }
};

struct SpawnActions {
  posix_spawn_file_actions_t fa{};
  posix_spawnattr_t attr{};
  bool fa_ok{false};
  bool attr_ok{false};
  ~SpawnActions() {
    if (fa_ok) posix_spawn_file_actions_destroy(&fa);
    if (attr_ok) posix_spawnattr_destroy(&attr);
  }
};

int wait_child(pid_t pid, int& status) {
  for (;;) {
    pid_t r = ::waitpid(pid, &status, 0);
    if (r == pid) return 0;
    if (r < 0 && errno == EINTR) continue;
    return errno ? errno : ECHILD;
  }
}

} // namespace

CommandResult run_command(const std::vector<std::string>& argv, milliseconds timeout) {
  CommandResult res;
  if (argv.empty() || argv[0].empty()) { res.error = "empty command"; return res; }

  PipeFds p;
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) { res.error = std::string("pipe2: ") + std::strerror(errno); return res; }
  p.rd = fds[0]; p.wr = fds[1];

  SpawnActions sa;
  if (posix_spawn_file_actions_init(&sa.fa) != 0) { res.error = "spawn file actions"; return res; }
  sa.fa_ok = true;
  posix_spawn_file_actions_addopen(&sa.fa, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
  posix_spawn_file_actions_adddup2(&sa.fa, p.wr, STDOUT_FILENO);
  posix_spawn_file_actions_addopen(&sa.fa, STDERR_FILENO, "/dev/null", O_WRONLY, 0);
  if (posix_spawnattr_init(&sa.attr) != 0) { res.error = "spawn attributes"; return res; }
  sa.attr_ok = true;
  posix_spawnattr_setflags(&sa.attr, POSIX_SPAWN_SETPGROUP);
  posix_spawnattr_setpgroup(&sa.attr, 0);

  std::vector<char*> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
  cargv.push_back(nullptr);

  pid_t pid = -1;
  int rc = ::posix_spawnp(&pid, cargv[0], &sa.fa, &sa.attr, cargv.data(), environ);
  if (rc != 0) {
    res.error = argv[0] + ": " + std::strerror(rc);
    return res;
  }
  res.launched = true;
  ::close(p.wr); p.wr = -1;

  const auto deadline = steady_clock::now() + timeout;
  char buf[4096];
  bool eof = false;
  while (!eof) {
    auto left = duration_cast<milliseconds>(deadline - steady_clock::now()).count();
    if (left <= 0) { res.timed_out = true; break; }
    struct pollfd pfd{.fd = p.rd, .events = POLLIN, .revents = 0};
    int pr = ::poll(&pfd, 1, static_cast<int>(left));
    if (pr < 0) {
      if (errno == EINTR) continue;
      res.error = std::string("poll: ") + std::strerror(errno);
      res.timed_out = true;
      break;
    }
    if (pr == 0) { res.timed_out = true; break; }
    ssize_t n = ::read(p.rd, buf, sizeof(buf));
    if (n > 0) { res.out.append(buf, static_cast<size_t>(n)); continue; }
    if (n == 0) { eof = true; break; }
    if (errno == EINTR || errno == EAGAIN) continue;
    res.error = std::string("read: ") + std::strerror(errno);
    break;
  }

  int status = 0;
  // stdout closed but the child may still be running; keep the deadline
  while (!res.timed_out) {
    pid_t r = ::waitpid(pid, &status, WNOHANG);
    if (r == pid) {
      if (WIFEXITED(status)) res.exit_code = WEXITSTATUS(status);
      return res;
    }
    if (r < 0 && errno != EINTR) {
      res.error = std::string("waitpid: ") + std::strerror(errno);
      return res;
    }
    if (steady_clock::now() >= deadline) { res.timed_out = true; break; }
    ::usleep(2000);
  }

  ::kill(-pid, SIGKILL);
  if (int werr = wait_child(pid, status); werr != 0) {
    res.error = std::string("waitpid: ") + std::strerror(werr);
  }
  return res;
}

} // namespace glance::util
