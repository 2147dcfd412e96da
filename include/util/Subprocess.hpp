#pragma once
#include <chrono>
#include <string>
#include <vector>

namespace glance::util {

struct CommandResult {
  bool launched{false};   // false when the program could not be started (ENOENT, EACCES, ...)
  bool timed_out{false};  // killed after the deadline
  int  exit_code{-1};     // valid when launched && !timed_out && exited normally
  std::string out;        // captured stdout
  std::string error;      // launch or wait failure description

  [[nodiscard]] bool ok() const { return launched && !timed_out && exit_code == 0; }
};

// Run argv[0] (PATH lookup) with stdin/stderr on /dev/null and stdout captured.
// The child runs in its own process group; when `timeout` expires the whole
// group is killed and the result is marked timed_out. Never throws for
// process-level failures; they are reported in the result.
CommandResult run_command(const std::vector<std::string>& argv, std::chrono::milliseconds timeout);

} // namespace glance::util
