#include "minitest.hpp"
#include "util/Subprocess.hpp"
#include <chrono>

using namespace std::chrono_literals;
using glance::util::run_command;

TEST(subprocess_captures_stdout) {
  auto r = run_command({"sh", "-c", "printf 'a,b\\nc\\n'"}, 5000ms);
  ASSERT_TRUE(r.ok());
  ASSERT_EQ(r.out, std::string("a,b\nc\n"));
}

TEST(subprocess_exit_code) {
  auto r = run_command({"sh", "-c", "echo partial; exit 3"}, 5000ms);
  ASSERT_TRUE(r.launched);
  ASSERT_TRUE(!r.timed_out);
  ASSERT_EQ(r.exit_code, 3);
  ASSERT_TRUE(!r.ok());
  ASSERT_EQ(r.out, std::string("partial\n"));
}

TEST(subprocess_missing_program) {
  auto r = run_command({"/nonexistent/glance-no-such-tool"}, 5000ms);
  ASSERT_TRUE(!r.launched);
  ASSERT_TRUE(!r.ok());
  ASSERT_TRUE(!r.error.empty());
}

TEST(subprocess_empty_argv) {
  auto r = run_command({}, 1000ms);
  ASSERT_TRUE(!r.launched);
}

TEST(subprocess_timeout_kills_group) {
  auto t0 = std::chrono::steady_clock::now();
  // The grandchild holds stdout open; killing the group releases it
  auto r = run_command({"sh", "-c", "sleep 30 & sleep 30"}, 200ms);
  auto elapsed = std::chrono::steady_clock::now() - t0;
  ASSERT_TRUE(r.launched);
  ASSERT_TRUE(r.timed_out);
  ASSERT_TRUE(!r.ok());
  ASSERT_TRUE(elapsed < 3s);
}
