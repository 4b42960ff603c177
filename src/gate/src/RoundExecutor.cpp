/**
 * @file RoundExecutor.cpp
 * @brief Service lifecycle and measurement of one round.
 */

#include "src/gate/inc/RoundExecutor.hpp"

#include <chrono>
#include <cstdio>

#include "src/gate/inc/GateError.hpp"
#include "src/gate/inc/GateUtils.hpp"
#include "src/gate/inc/ProcessTree.hpp"
#include "src/gate/inc/ResourceSampler.hpp"
#include "src/gate/inc/RoundLog.hpp"

namespace quorum {
namespace gate {

namespace {

constexpr const char* LOOPBACK = "127.0.0.1";
constexpr int STATS_MAX_TIME_S = 2;

[[noreturn]] void failWithLog(ErrorKind kind, const std::string& message,
                              const std::string& label, const std::string& logPath) {
  std::fprintf(stderr, "[ERROR] %s\n", message.c_str());
  dumpLogHead(label, logPath);
  throw GateError(kind, message);
}

} // namespace

void dumpLogHead(const std::string& label, const std::string& path) {
  std::fprintf(stderr, "[ERROR] ---- %s log (%s, first 120 lines) ----\n", label.c_str(),
               path.c_str());
  std::fputs(headOfFile(path, 120).c_str(), stderr);
  std::fprintf(stderr, "[ERROR] ---- end of %s log ----\n", label.c_str());
  std::fflush(stderr);
}

ServiceRoundSource::ServiceRoundSource(const GateConfig& cfg, std::vector<ScenarioSpec> scenarios,
                                       CorePins pins, ConfigFileGuard& subjectConfig,
                                       std::filesystem::path workDir, LoadGenerator& load)
    : cfg_(cfg), scenarios_(std::move(scenarios)), ids_(scenarioIds(scenarios_)), pins_(pins),
      subjectConfig_(subjectConfig), workDir_(std::move(workDir)), load_(load),
      curl_(cfg.curlBin) {}

RoundResult ServiceRoundSource::runRound(int roundIndex, int /*targetRounds*/) {
  std::string roundLog;
  for (const auto& spec : scenarios_) {
    throwIfInterrupted();
    roundLog += runScenario(spec);
  }
  const std::filesystem::path LOG_PATH =
      workDir_ / ("round_" + std::to_string(roundIndex) + ".log");
  if (!writeFile(LOG_PATH, roundLog)) {
    std::fprintf(stderr, "[WARN] could not keep round log %s\n", LOG_PATH.c_str());
  }
  return parseRoundLog(roundLog, ids_);
}

std::string ServiceRoundSource::runScenario(const ScenarioSpec& spec) {
  const std::string UPSTREAM_LOG = (workDir_ / "upstream.log").string();
  const std::string SUBJECT_LOG = (workDir_ / "subject.log").string();
  const auto STARTUP = std::chrono::seconds(cfg_.startupTimeoutS);

  std::printf("[round] %s\n", spec.id.c_str());
  std::fflush(stdout);

  // ---- Upstream simulator ----
  SpawnOptions upOpts;
  upOpts.argv = {cfg_.mockUpstreamBin};
  upOpts.env = upstreamEnvironment(spec, cfg_);
  upOpts.logPath = UPSTREAM_LOG;
  upOpts.cpuCore = pins_.upstream;
  ChildProcess upstream = ChildProcess::spawn(upOpts);

  if (!waitForPort(LOOPBACK, cfg_.upstreamPort, STARTUP)) {
    failWithLog(ErrorKind::Round,
                "mock upstream did not become ready in " + std::to_string(cfg_.startupTimeoutS) +
                    "s",
                "upstream", UPSTREAM_LOG);
  }

  // ---- Subject service ----
  subjectConfig_.write(renderSubjectConfig(spec, cfg_));

  SpawnOptions subjOpts;
  subjOpts.argv = {cfg_.subjectBin};
  subjOpts.logPath = SUBJECT_LOG;
  subjOpts.cpuCore = pins_.subject;
  ChildProcess subject = ChildProcess::spawn(subjOpts);

  if (!waitForPort(LOOPBACK, cfg_.proxyPort, STARTUP)) {
    failWithLog(ErrorKind::Round,
                cfg_.subjectName + " did not become ready in " +
                    std::to_string(cfg_.startupTimeoutS) + "s",
                cfg_.subjectName, SUBJECT_LOG);
  }

  const std::string URL =
      "http://" + std::string(LOOPBACK) + ":" + std::to_string(cfg_.proxyPort) +
      "/v1/chat/completions";
  const std::string BODY = requestPayload(spec);

  if (!waitForHttpReady(curl_, URL, BODY, STARTUP)) {
    failWithLog(ErrorKind::Round,
                cfg_.subjectName + " HTTP endpoint did not become ready in " +
                    std::to_string(cfg_.startupTimeoutS) + "s",
                cfg_.subjectName, SUBJECT_LOG);
  }

  const int ANSWERED = sendWarmupRequests(curl_, URL, BODY, cfg_.warmupRequests,
                                         cfg_.warmupConnectTimeoutS, cfg_.warmupMaxTimeS);
  std::printf("[round] %s warm-up answered %d/%d\n", spec.id.c_str(), ANSWERED,
              cfg_.warmupRequests);

  // ---- Measured phase ----
  const ProcfsTreeView VIEW;
  const WrapperResolver RESOLVER(cfg_.subjectName);
  const pid_t STATS_PID = RESOLVER.resolve(VIEW, subject.pid());

  LoadRequest req;
  req.url = URL;
  req.body = BODY;
  req.duration = cfg_.policy.duration;
  req.durationSeconds = parseDurationSeconds(cfg_.policy.duration).value_or(0.0);
  req.threads = cfg_.wrkThreads;
  req.connections = cfg_.connections;
  req.timeout = cfg_.wrkTimeout;
  req.cpuCore = pins_.loadGenerator;

  ResourceSampler sampler(STATS_PID);
  sampler.start();
  const std::string WRK_OUT = load_.run(req);
  const ResourceUsage USAGE = sampler.stop();

  if (cfg_.requireUpstreamH2) {
    assertUpstreamPurity(spec, UPSTREAM_LOG);
  }

  subject.terminate();
  upstream.terminate();

  // ---- Round-log lines ----
  const WrkSummary SUMMARY = parseWrkSummary(WRK_OUT);
  if (!SUMMARY.requestsPerSecond || !SUMMARY.totalRequests) {
    throw GateError(ErrorKind::Round, spec.id + ": load generator summary lacks request totals");
  }
  const std::string LOAD_LINE = formatLoadLine(spec.id, SUMMARY);
  const std::string RES_LINE = formatResourceLine(spec.id, USAGE.cpuPercent, USAGE.peakRssKb);
  std::printf("%s\n%s\n", LOAD_LINE.c_str(), RES_LINE.c_str());
  std::fflush(stdout);
  return LOAD_LINE + "\n" + RES_LINE + "\n";
}

void ServiceRoundSource::assertUpstreamPurity(const ScenarioSpec& spec,
                                              const std::string& upstreamLog) const {
  const std::string URL = "http://" + std::string(LOOPBACK) + ":" +
                          std::to_string(cfg_.upstreamPort) + "/_mock/stats";
  const auto BODY = curl_.get(URL, cfg_.upstreamTransport == "h2c", STATS_MAX_TIME_S);
  const auto STATS = BODY ? parseUpstreamStats(*BODY) : std::nullopt;
  if (!STATS) {
    failWithLog(ErrorKind::Round,
                spec.id + " failed to parse upstream stats JSON: " + BODY.value_or(""),
                "upstream", upstreamLog);
  }
  if (!isPureH2(*STATS)) {
    failWithLog(ErrorKind::ProtocolPurity,
                spec.id + " upstream protocol assertion failed: expected pure h2 traffic, got h2=" +
                    std::to_string(STATS->h2) + " h1=" + std::to_string(STATS->h1),
                "upstream", upstreamLog);
  }
  std::printf("%s upstream_proto_h2_ok h2=%lld h1=%lld\n", spec.id.c_str(), STATS->h2,
              STATS->h1);
}

} // namespace gate
} // namespace quorum
