/**
 * @file Process_uTest.cpp
 * @brief Unit tests for subprocess supervision and scoped run resources.
 */

#include "src/gate/inc/Process.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <csignal>
#include <filesystem>
#include <string>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include "src/gate/inc/GateError.hpp"
#include "src/gate/inc/GateUtils.hpp"
#include "src/gate/utst/helpers/ScriptedRoundSource.hpp"

using quorum::gate::ChildProcess;
using quorum::gate::CommandResult;
using quorum::gate::ConfigFileGuard;
using quorum::gate::ErrorKind;
using quorum::gate::findExecutable;
using quorum::gate::GateError;
using quorum::gate::requireExecutable;
using quorum::gate::RunLock;
using quorum::gate::runCommand;
using quorum::gate::slurp;
using quorum::gate::SpawnOptions;
using quorum::gate::TempDir;
using quorum::gate::waitForPort;
using quorum::gate::writeFile;
using quorum::gate::test::ScratchDir;

using namespace std::chrono_literals;

namespace {

/** @brief Alive and not a zombie awaiting reaping by init. */
bool processAlive(pid_t pid) {
  if (::kill(pid, 0) != 0) {
    return false;
  }
  const std::string STAT = slurp("/proc/" + std::to_string(pid) + "/stat");
  const std::size_t CLOSE = STAT.rfind(')');
  return CLOSE != std::string::npos && CLOSE + 2 < STAT.size() && STAT[CLOSE + 2] != 'Z';
}

} // namespace

/* ----------------------------- Executables ----------------------------- */

/** @test PATH lookup finds sh; a missing tool is a setup error naming its role. */
TEST(ProcessTest, FindExecutable) {
  EXPECT_TRUE(findExecutable("sh").has_value());
  EXPECT_TRUE(findExecutable("/bin/sh").has_value());
  EXPECT_FALSE(findExecutable("quorum-no-such-tool").has_value());
  EXPECT_FALSE(findExecutable("/tmp").has_value());
  try {
    requireExecutable("quorum-no-such-tool", "load generator");
    FAIL() << "expected GateError";
  } catch (const GateError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::Setup);
    EXPECT_NE(std::string(e.what()).find("load generator"), std::string::npos);
  }
}

/* ----------------------------- runCommand ----------------------------- */

/** @test Stdout is captured and the exit code reported. */
TEST(ProcessTest, RunCommandCapturesOutput) {
  const CommandResult R = runCommand({"sh", "-c", "echo hello; echo oops >&2; exit 3"}, 5000ms);
  EXPECT_EQ(R.output, "hello\n");
  EXPECT_EQ(R.exitCode, 3);
  EXPECT_FALSE(R.timedOut);
}

/** @test Stderr joins the capture on request. */
TEST(ProcessTest, RunCommandCapturesStderr) {
  const CommandResult R =
      runCommand({"sh", "-c", "echo oops >&2"}, 5000ms, std::nullopt, /*captureStderr=*/true);
  EXPECT_EQ(R.output, "oops\n");
  EXPECT_EQ(R.exitCode, 0);
}

/** @test A command that overruns its budget is killed and flagged. */
TEST(ProcessTest, RunCommandTimeout) {
  const auto T0 = std::chrono::steady_clock::now();
  const CommandResult R = runCommand({"sleep", "10"}, 200ms);
  EXPECT_TRUE(R.timedOut);
  EXPECT_NE(R.exitCode, 0);
  EXPECT_LT(std::chrono::steady_clock::now() - T0, 5s);
}

/** @test An unlaunchable program exits non-zero without throwing. */
TEST(ProcessTest, RunCommandMissingProgram) {
  const CommandResult R = runCommand({"quorum-no-such-tool"}, 2000ms);
  EXPECT_NE(R.exitCode, 0);
  EXPECT_FALSE(R.timedOut);
}

/** @test Pinning to core 0 still runs the command. */
TEST(ProcessTest, RunCommandPinned) {
  const CommandResult R = runCommand({"sh", "-c", "echo pinned"}, 5000ms, 0);
  EXPECT_EQ(R.output, "pinned\n");
}

/* ----------------------------- ChildProcess ----------------------------- */

/** @test A child writes to its log, sees env overrides, and reports its exit code. */
TEST(ProcessTest, SpawnWithLogAndEnv) {
  ScratchDir dir("quorum_spawn");
  SpawnOptions opts;
  opts.argv = {"sh", "-c", "echo mode=$MOCK_MODE; exit 7"};
  opts.env = {{"MOCK_MODE", "h2"}};
  opts.logPath = (dir.path() / "child.log").string();

  ChildProcess child = ChildProcess::spawn(opts);
  EXPECT_GT(child.pid(), 0);
  const auto CODE = child.waitFor(5000ms);
  ASSERT_TRUE(CODE.has_value());
  EXPECT_EQ(*CODE, 7);
  EXPECT_EQ(slurp(dir.path() / "child.log"), "mode=h2\n");
}

/** @test terminate() stops a long-running child and its grandchildren. */
TEST(ProcessTest, TerminateStopsGroup) {
  ScratchDir dir("quorum_terminate");
  const auto PID_FILE = dir.path() / "grandchild.pid";
  SpawnOptions opts;
  opts.argv = {"sh", "-c", "sleep 30 & echo $! > " + PID_FILE.string() + "; wait"};

  ChildProcess child = ChildProcess::spawn(opts);
  const auto DEADLINE = std::chrono::steady_clock::now() + 5s;
  while (slurp(PID_FILE).empty() && std::chrono::steady_clock::now() < DEADLINE) {
    std::this_thread::sleep_for(10ms);
  }
  const auto GRANDCHILD = quorum::gate::parseInt(slurp(PID_FILE));
  ASSERT_TRUE(GRANDCHILD.has_value());

  EXPECT_TRUE(child.running());
  child.terminate(500ms);
  EXPECT_FALSE(child.running());
  EXPECT_FALSE(child.waitFor(0ms) == std::nullopt);

  // Grandchild is reaped by init; give it a moment to disappear.
  const auto GONE_BY = std::chrono::steady_clock::now() + 3s;
  while (processAlive(static_cast<pid_t>(*GRANDCHILD)) &&
         std::chrono::steady_clock::now() < GONE_BY) {
    std::this_thread::sleep_for(20ms);
  }
  EXPECT_FALSE(processAlive(static_cast<pid_t>(*GRANDCHILD)));
}

/** @test A moved-from child no longer owns the process. */
TEST(ProcessTest, ChildIsMoveOnly) {
  SpawnOptions opts;
  opts.argv = {"sleep", "30"};
  ChildProcess a = ChildProcess::spawn(opts);
  const pid_t PID = a.pid();
  ChildProcess b = std::move(a);
  EXPECT_EQ(b.pid(), PID);
  EXPECT_LE(a.pid(), 0); // NOLINT(bugprone-use-after-move)
  b.terminate(500ms);
  EXPECT_FALSE(b.running());
}

/** @test Spawning with no command is a setup error. */
TEST(ProcessTest, SpawnEmptyCommand) {
  EXPECT_THROW(ChildProcess::spawn(SpawnOptions{}), GateError);
}

/* ----------------------------- waitForPort ----------------------------- */

/** @test A listening socket is detected; a closed port times out. */
TEST(ProcessTest, WaitForPort) {
  const int FD = ::socket(AF_INET, SOCK_STREAM, 0);
  ASSERT_GE(FD, 0);
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = 0;
  ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
  ASSERT_EQ(::bind(FD, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
  ASSERT_EQ(::listen(FD, 4), 0);
  socklen_t len = sizeof(addr);
  ASSERT_EQ(::getsockname(FD, reinterpret_cast<sockaddr*>(&addr), &len), 0);
  const int PORT = ntohs(addr.sin_port);

  EXPECT_TRUE(waitForPort("127.0.0.1", PORT, 1000ms));
  ::close(FD);
  EXPECT_FALSE(waitForPort("127.0.0.1", PORT, 150ms));
  EXPECT_THROW(waitForPort("not-an-ip", PORT, 10ms), GateError);
}

/* ----------------------------- Scoped resources ----------------------------- */

/** @test TempDir exists for its lifetime and is removed with its contents. */
TEST(ProcessTest, TempDirLifetime) {
  std::filesystem::path p;
  {
    TempDir tmp("quorum_tempdir_test");
    p = tmp.path();
    EXPECT_TRUE(std::filesystem::is_directory(p));
    writeFile(p / "round_1.log", "x");
  }
  EXPECT_FALSE(std::filesystem::exists(p));
}

/** @test An existing config is restored byte-for-byte. */
TEST(ProcessTest, ConfigGuardRestoresOriginal) {
  ScratchDir dir("quorum_cfg_restore");
  const auto TARGET = dir.path() / "config.yaml";
  writeFile(TARGET, "original: true\n");
  {
    ConfigFileGuard guard(TARGET, dir.path());
    EXPECT_TRUE(guard.hadOriginal());
    guard.write("generated: 1\n");
    EXPECT_EQ(slurp(TARGET), "generated: 1\n");
  }
  EXPECT_EQ(slurp(TARGET), "original: true\n");
}

/** @test A config that did not exist is removed again. */
TEST(ProcessTest, ConfigGuardRemovesGenerated) {
  ScratchDir dir("quorum_cfg_remove");
  const auto TARGET = dir.path() / "config.yaml";
  {
    ConfigFileGuard guard(TARGET, dir.path());
    EXPECT_FALSE(guard.hadOriginal());
    guard.write("generated: 1\n");
    EXPECT_TRUE(std::filesystem::exists(TARGET));
  }
  EXPECT_FALSE(std::filesystem::exists(TARGET));
}

/** @test Restoration also happens when the scope is left by an exception. */
TEST(ProcessTest, ConfigGuardRestoresOnError) {
  ScratchDir dir("quorum_cfg_throw");
  const auto TARGET = dir.path() / "config.yaml";
  writeFile(TARGET, "original: true\n");
  try {
    ConfigFileGuard guard(TARGET, dir.path());
    guard.write("generated: 1\n");
    throw GateError(ErrorKind::Round, "subject crashed");
  } catch (const GateError&) {
  }
  EXPECT_EQ(slurp(TARGET), "original: true\n");
}

/** @test A second lock holder is rejected with a setup error; release frees the lock. */
TEST(ProcessTest, RunLockContention) {
  ScratchDir dir("quorum_lock");
  const std::string PATH = (dir.path() / "gate.lock").string();
  {
    RunLock first(PATH);
    try {
      RunLock second(PATH);
      FAIL() << "expected GateError";
    } catch (const GateError& e) {
      EXPECT_EQ(e.kind(), ErrorKind::Setup);
      EXPECT_NE(std::string(e.what()).find("another gate invocation"), std::string::npos);
    }
  }
  EXPECT_NO_THROW(RunLock again(PATH));
}
