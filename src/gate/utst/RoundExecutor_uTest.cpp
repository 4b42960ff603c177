/**
 * @file RoundExecutor_uTest.cpp
 * @brief Unit tests for ServiceRoundSource with stand-in services, curl and load generator.
 *
 * The test process owns loopback listeners on the service ports, so readiness checks succeed
 * (or time out) without real servers. The spawned "services" are shell scripts that record
 * their pid and sleep.
 */

#include "src/gate/inc/RoundExecutor.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <signal.h>
#include <sys/socket.h>
#include <unistd.h>

#include "src/gate/inc/GateError.hpp"
#include "src/gate/inc/GateUtils.hpp"
#include "src/gate/inc/RoundLog.hpp"
#include "src/gate/utst/helpers/ScriptedRoundSource.hpp"

using quorum::gate::ConfigFileGuard;
using quorum::gate::defaultScenarios;
using quorum::gate::CorePins;
using quorum::gate::ErrorKind;
using quorum::gate::GateConfig;
using quorum::gate::GateError;
using quorum::gate::installInterruptHandlers;
using quorum::gate::LoadGenerator;
using quorum::gate::LoadRequest;
using quorum::gate::parseInt;
using quorum::gate::parseLoadLine;
using quorum::gate::parseResourceLine;
using quorum::gate::RoundResult;
using quorum::gate::ScenarioSpec;
using quorum::gate::ServiceRoundSource;
using quorum::gate::slurp;
using quorum::gate::splitLines;
using quorum::gate::WrkLoadGenerator;
using quorum::gate::writeFile;
using quorum::gate::test::ScratchDir;

namespace {

const std::string ORIGINAL_CONFIG = "listen: original\n";

const std::string WRK_SUMMARY = "  Latency   812.34us  120.50us   3.21ms   90.12%\n"
                                "     99%    1.25ms\n"
                                "  98012 requests in 10.00s, 20.10MB read\n"
                                "Requests/sec:   9801.20\n";

/** @brief Listening loopback socket on an ephemeral port; connections queue unaccepted. */
class LoopbackListener {
public:
  LoopbackListener() {
    fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = 0;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    ::bind(fd_, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
    ::listen(fd_, 128);
    socklen_t len = sizeof(addr);
    ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
    port_ = ntohs(addr.sin_port);
  }
  ~LoopbackListener() { close(); }

  LoopbackListener(const LoopbackListener&) = delete;
  LoopbackListener& operator=(const LoopbackListener&) = delete;

  int port() const { return port_; }

  void close() {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

private:
  int fd_ = -1;
  int port_ = 0;
};

/** @brief A port nobody listens on. */
int unusedPort() {
  LoopbackListener l;
  const int PORT = l.port();
  l.close();
  return PORT;
}

std::string writeScript(const std::filesystem::path& path, const std::string& body) {
  writeFile(path, "#!/bin/sh\n" + body);
  std::filesystem::permissions(path, std::filesystem::perms::owner_all);
  return path.string();
}

/** @brief Service stand-in: records its pid, then sleeps as the same process. */
std::string fakeService(const ScratchDir& dir, const std::string& name) {
  return writeScript(dir.path() / (name + ".sh"),
                     "echo $$ > \"" + (dir.path() / (name + ".pid")).string() + "\"\n"
                     "exec sleep 30\n");
}

/** @brief curl stand-in: prints @p statsBody for the stats endpoint and 200 for any POST. */
std::string fakeCurl(const ScratchDir& dir, const std::string& statsBody) {
  return writeScript(dir.path() / "fake_curl.sh", "for a in \"$@\"; do\n"
                                                  "  case \"$a\" in\n"
                                                  "    */_mock/stats) printf '%s' '" +
                                                      statsBody +
                                                      "'; exit 0 ;;\n"
                                                      "  esac\n"
                                                      "done\n"
                                                      "printf '200'\n");
}

std::optional<pid_t> recordedPid(const ScratchDir& dir, const std::string& name) {
  const auto PID = parseInt(slurp(dir.path() / (name + ".pid")));
  if (!PID) {
    return std::nullopt;
  }
  return static_cast<pid_t>(*PID);
}

/** @brief Alive and not a zombie. */
bool processAlive(pid_t pid) {
  if (::kill(pid, 0) != 0) {
    return false;
  }
  const std::string STAT = slurp("/proc/" + std::to_string(pid) + "/stat");
  const std::size_t CLOSE = STAT.rfind(')');
  return CLOSE != std::string::npos && CLOSE + 2 < STAT.size() && STAT[CLOSE + 2] != 'Z';
}

bool serviceGone(const ScratchDir& dir, const std::string& name) {
  const auto PID = recordedPid(dir, name);
  return !PID || !processAlive(*PID);
}

/** @brief Load generator returning a canned wrk summary. */
class CannedLoad final : public LoadGenerator {
public:
  std::string run(const LoadRequest& request) override {
    requests.push_back(request);
    return WRK_SUMMARY;
  }
  std::vector<LoadRequest> requests;
};

/** @brief Everything a ServiceRoundSource borrows, wired to stand-ins. */
struct Rig {
  explicit Rig(const std::string& name, const std::string& statsBody = "{\"h1\":0,\"h2\":5}")
      : dir(name) {
    cfg.mockUpstreamBin = fakeService(dir, "upstream");
    cfg.subjectBin = fakeService(dir, "subject");
    cfg.subjectName = "sleep";
    cfg.curlBin = fakeCurl(dir, statsBody);
    cfg.subjectConfig = (dir.path() / "config.yaml").string();
    cfg.upstreamPort = upstream.port();
    cfg.proxyPort = subject.port();
    cfg.startupTimeoutS = 1;
    cfg.warmupRequests = 2;
    cfg.policy.duration = "1s";
    writeFile(cfg.subjectConfig, ORIGINAL_CONFIG);
  }

  ScratchDir dir;
  LoopbackListener upstream;
  LoopbackListener subject;
  GateConfig cfg;
  ScenarioSpec scenario = defaultScenarios(false).front();
};

} // namespace

/* ----------------------------- Measured scenario ----------------------------- */

/** @test A clean scenario yields parseable round-log lines and stops both services. */
TEST(RoundExecutorTest, ScenarioPrintsRoundLogLines) {
  Rig rig("quorum_exec_ok");
  CannedLoad load;
  std::string lines;
  {
    ConfigFileGuard guard(rig.cfg.subjectConfig, rig.dir.path());
    ServiceRoundSource source(rig.cfg, {rig.scenario}, CorePins{}, guard, rig.dir.path(), load);
    lines = source.runScenario(rig.scenario);
    EXPECT_NE(slurp(rig.cfg.subjectConfig), ORIGINAL_CONFIG);
  }

  const auto LINES = splitLines(lines);
  ASSERT_EQ(LINES.size(), 2u);
  const auto LOAD_LINE = parseLoadLine(LINES[0]);
  ASSERT_TRUE(LOAD_LINE.has_value());
  EXPECT_EQ(LOAD_LINE->scenario, rig.scenario.id);
  EXPECT_DOUBLE_EQ(LOAD_LINE->requestsPerSecond, 9801.20);
  EXPECT_TRUE(parseResourceLine(LINES[1]).has_value());

  ASSERT_EQ(load.requests.size(), 1u);
  EXPECT_EQ(load.requests[0].connections, 8);
  EXPECT_DOUBLE_EQ(load.requests[0].durationSeconds, 1.0);
  EXPECT_NE(load.requests[0].url.find(std::to_string(rig.cfg.proxyPort)), std::string::npos);

  EXPECT_TRUE(serviceGone(rig.dir, "subject"));
  EXPECT_TRUE(serviceGone(rig.dir, "upstream"));
  EXPECT_EQ(slurp(rig.cfg.subjectConfig), ORIGINAL_CONFIG);
}

/** @test A round keeps its log in the work directory and parses metrics back from it. */
TEST(RoundExecutorTest, RoundParsesItsOwnLog) {
  Rig rig("quorum_exec_round");
  CannedLoad load;
  ConfigFileGuard guard(rig.cfg.subjectConfig, rig.dir.path());
  ServiceRoundSource source(rig.cfg, {rig.scenario}, CorePins{}, guard, rig.dir.path(), load);

  const RoundResult R = source.runRound(1, 1);
  ASSERT_EQ(R.count(rig.scenario.id), 1u);
  EXPECT_DOUBLE_EQ(R.at(rig.scenario.id).requestsPerSecond, 9801.20);
  EXPECT_DOUBLE_EQ(R.at(rig.scenario.id).p99LatencyUs, 1250.0);
  EXPECT_TRUE(std::filesystem::exists(rig.dir.path() / "round_1.log"));
}

/* ----------------------------- Fatal conditions ----------------------------- */

/** @test A subject that never opens its port is a round error; services stop, config returns. */
TEST(RoundExecutorTest, NeverReadySubjectIsRoundError) {
  Rig rig("quorum_exec_not_ready");
  rig.subject.close();
  rig.cfg.proxyPort = unusedPort();
  CannedLoad load;
  {
    ConfigFileGuard guard(rig.cfg.subjectConfig, rig.dir.path());
    ServiceRoundSource source(rig.cfg, {rig.scenario}, CorePins{}, guard, rig.dir.path(), load);
    try {
      (void)source.runScenario(rig.scenario);
      FAIL() << "expected GateError";
    } catch (const GateError& e) {
      EXPECT_EQ(e.kind(), ErrorKind::Round);
      EXPECT_NE(std::string(e.what()).find("did not become ready"), std::string::npos);
    }
  }
  EXPECT_TRUE(load.requests.empty());
  EXPECT_TRUE(serviceGone(rig.dir, "subject"));
  EXPECT_TRUE(serviceGone(rig.dir, "upstream"));
  EXPECT_EQ(slurp(rig.cfg.subjectConfig), ORIGINAL_CONFIG);
}

/** @test Any HTTP/1.1 traffic at the upstream is a protocol-purity error. */
TEST(RoundExecutorTest, ImpureUpstreamIsProtocolError) {
  Rig rig("quorum_exec_impure", "{\"h1\":1,\"h2\":5}");
  CannedLoad load;
  {
    ConfigFileGuard guard(rig.cfg.subjectConfig, rig.dir.path());
    ServiceRoundSource source(rig.cfg, {rig.scenario}, CorePins{}, guard, rig.dir.path(), load);
    try {
      (void)source.runScenario(rig.scenario);
      FAIL() << "expected GateError";
    } catch (const GateError& e) {
      EXPECT_EQ(e.kind(), ErrorKind::ProtocolPurity);
      EXPECT_NE(std::string(e.what()).find("h2=5 h1=1"), std::string::npos);
    }
  }
  EXPECT_TRUE(serviceGone(rig.dir, "subject"));
  EXPECT_TRUE(serviceGone(rig.dir, "upstream"));
  EXPECT_EQ(slurp(rig.cfg.subjectConfig), ORIGINAL_CONFIG);
}

/** @test Unreadable upstream stats are a round error. */
TEST(RoundExecutorTest, UnparseableStatsIsRoundError) {
  Rig rig("quorum_exec_bad_stats", "not json");
  CannedLoad load;
  ConfigFileGuard guard(rig.cfg.subjectConfig, rig.dir.path());
  ServiceRoundSource source(rig.cfg, {rig.scenario}, CorePins{}, guard, rig.dir.path(), load);
  try {
    (void)source.runScenario(rig.scenario);
    FAIL() << "expected GateError";
  } catch (const GateError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::Round);
  }
}

/* ----------------------------- Interruption ----------------------------- */

namespace {

/**
 * @brief Run one scenario whose load generator delivers SIGINT to this process mid-run.
 *
 * Runs in a forked death-test child because the interruption flag is process-wide.
 * @return 0 when the interruption surfaced as a GateError, both services were stopped and
 *         the configuration file was restored; a distinct non-zero code per failed check.
 */
int interruptDuringLoad() {
  installInterruptHandlers();
  Rig rig("quorum_exec_sigint");
  const std::string WRK = writeScript(rig.dir.path() / "fake_wrk.sh",
                                      "kill -INT $PPID\n"
                                      "exec sleep 5\n");
  WrkLoadGenerator load(WRK, rig.dir.path());

  int code = 10;
  {
    ConfigFileGuard guard(rig.cfg.subjectConfig, rig.dir.path());
    ServiceRoundSource source(rig.cfg, {rig.scenario}, CorePins{}, guard, rig.dir.path(), load);
    try {
      (void)source.runScenario(rig.scenario);
    } catch (const GateError& e) {
      code = (e.kind() == ErrorKind::Round) ? 0 : 11;
    }
  }
  if (code == 0 && !serviceGone(rig.dir, "subject")) {
    code = 12;
  }
  if (code == 0 && !serviceGone(rig.dir, "upstream")) {
    code = 13;
  }
  if (code == 0 && slurp(rig.cfg.subjectConfig) != ORIGINAL_CONFIG) {
    code = 14;
  }
  return code;
}

} // namespace

/** @test SIGINT during the load phase aborts the round and still cleans up. */
TEST(RoundExecutorDeathTest, InterruptDuringLoadCleansUp) {
  EXPECT_EXIT(std::exit(interruptDuringLoad()), ::testing::ExitedWithCode(0), "");
}
