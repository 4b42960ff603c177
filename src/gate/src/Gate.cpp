/**
 * @file Gate.cpp
 * @brief Gate and recut orchestration.
 */

#include "src/gate/inc/Gate.hpp"

#include <cstdio>
#include <filesystem>

#include <unistd.h>

#include "src/gate/inc/GateError.hpp"
#include "src/gate/inc/GateStats.hpp"
#include "src/gate/inc/LoadGenerator.hpp"
#include "src/gate/inc/Process.hpp"
#include "src/gate/inc/RoundExecutor.hpp"
#include "src/gate/inc/Scenarios.hpp"

namespace quorum {
namespace gate {

namespace {

std::string pinLabel(const std::optional<int>& core) {
  return core ? std::to_string(*core) : "none";
}

/**
 * @brief Run-scoped resources of a live invocation, released in reverse order.
 */
struct LiveRun {
  TempDir tmp;
  ConfigFileGuard subjectConfig;
  WrkLoadGenerator wrk;
  ServiceRoundSource source;

  LiveRun(const GateConfig& cfg, std::vector<ScenarioSpec> specs, CorePins pins)
      : tmp("quorum_gate"), subjectConfig(cfg.subjectConfig, tmp.path()),
        wrk(cfg.wrkBin, tmp.path()),
        source(cfg, std::move(specs), pins, subjectConfig, tmp.path(), wrk) {}
};

void requireCollaborators(const GateConfig& cfg) {
  requireExecutable(cfg.subjectBin, "subject binary");
  requireExecutable(cfg.mockUpstreamBin, "mock upstream binary");
  requireExecutable(cfg.wrkBin, "wrk");
  requireExecutable(cfg.curlBin, "curl");
}

CorePins resolvePins(const GateConfig& cfg) {
  const CorePins PINS = effectivePins(cfg, ::sysconf(_SC_NPROCESSORS_ONLN));
  std::printf("[gate] auto_pin_cores=%d pin_proxy_core=%s pin_upstream_core=%s pin_wrk_core=%s\n",
              cfg.autoPinCores ? 1 : 0, pinLabel(PINS.subject).c_str(),
              pinLabel(PINS.upstream).c_str(), pinLabel(PINS.loadGenerator).c_str());
  return PINS;
}

} // namespace

/* --------------------------------- Gate --------------------------------- */

GateOutcome runGateWith(RoundSource& source, const GateConfig& cfg,
                        const std::vector<ScenarioId>& scenarios, const Baseline& baseline,
                        const RunMetadata& meta) {
  GateOutcome outcome;
  outcome.verdict = runRounds(source, scenarios, baseline, cfg.policy);
  const std::string REPORT = renderGateReport(outcome.verdict, cfg, meta);
  outcome.report = writeGateReport(REPORT, cfg.outDir, cfg.reportStem, meta.fileStamp);
  std::fputs(REPORT.c_str(), stdout);
  std::printf("[gate] report: %s\n", outcome.report.timestamped.c_str());
  std::fflush(stdout);
  return outcome;
}

GateOutcome runGate(const GateConfig& cfg) {
  const RunLock LOCK(cfg.lockFile);
  return runGateLocked(cfg);
}

GateOutcome runGateLocked(const GateConfig& cfg) {
  printGateConfig(cfg);
  const auto SPECS = defaultScenarios(cfg.includeAliasRemap);
  const auto IDS = scenarioIds(SPECS);

  requireCollaborators(cfg);
  const Baseline BASELINE = loadBaseline(cfg.baselineFile, IDS);
  const CorePins PINS = resolvePins(cfg);
  const RunMetadata META = captureRunMetadata();

  LiveRun run(cfg, SPECS, PINS);
  return runGateWith(run.source, cfg, IDS, BASELINE, META);
}

/* --------------------------------- Recut --------------------------------- */

BaselineDocument buildBaselineSnapshot(const MetricHistory& history, const GateConfig& cfg,
                                       const RunMetadata& meta) {
  const int ROUNDS = history.roundsExecuted();
  BaselineDocument doc;
  doc.preamble = {
      "# Baseline Snapshot",
      "",
      "- Date: " + meta.date,
      "- Profile: single-core `" + std::to_string(cfg.wrkThreads) + "x" +
          std::to_string(cfg.connections) + "`",
      "- Rounds: " + std::to_string(ROUNDS),
      "- Duration per scenario: " + cfg.policy.duration,
      "- Upstream transport: " + cfg.upstreamTransport,
      "- Require upstream h2: " + std::string(cfg.requireUpstreamH2 ? "1" : "0"),
      "- Mock scenario: " + cfg.mockScenario,
      "",
  };
  for (const auto& id : history.scenarios()) {
    doc.rows.push_back(makeBaselineRow(
        id, median(history.series(id, &RoundMetrics::requestsPerSecond)),
        median(history.series(id, &RoundMetrics::p99LatencyUs)),
        median(history.series(id, &RoundMetrics::cpuPercent)),
        median(history.series(id, &RoundMetrics::residentMemoryKb)), ROUNDS));
  }
  return doc;
}

BaselineDocument runRecutWith(RoundSource& source, const GateConfig& cfg,
                              const std::vector<ScenarioId>& scenarios, const RunMetadata& meta,
                              const std::string& outFile) {
  const MetricHistory HISTORY = collectRounds(source, scenarios, cfg.policy.plannedRounds);
  BaselineDocument doc = buildBaselineSnapshot(HISTORY, cfg, meta);
  writeBaselineDocument(outFile, doc);
  std::printf("[baseline] wrote %s\n", outFile.c_str());
  std::fflush(stdout);
  return doc;
}

BaselineDocument runRecut(const GateConfig& cfg, const std::string& outFile) {
  const RunLock LOCK(cfg.lockFile);
  printGateConfig(cfg);
  const auto SPECS = defaultScenarios(cfg.includeAliasRemap);
  const auto IDS = scenarioIds(SPECS);

  requireCollaborators(cfg);
  const CorePins PINS = resolvePins(cfg);
  const RunMetadata META = captureRunMetadata();

  LiveRun run(cfg, SPECS, PINS);
  return runRecutWith(run.source, cfg, IDS, META, outFile);
}

} // namespace gate
} // namespace quorum
