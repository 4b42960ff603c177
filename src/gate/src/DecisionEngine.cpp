/**
 * @file DecisionEngine.cpp
 * @brief Implementation of round scoring, quorum accounting and the gate round loop.
 */

#include "src/gate/inc/DecisionEngine.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

#include "src/gate/inc/GateError.hpp"
#include "src/gate/inc/GateStats.hpp"

namespace quorum {
namespace gate {

/* ----------------------------- MetricHistory ----------------------------- */

MetricHistory::MetricHistory(std::vector<ScenarioId> scenarios) : scenarios_(std::move(scenarios)) {
  for (const auto& s : scenarios_) {
    tracks_[s];
  }
}

void MetricHistory::record(int roundIndex, const RoundResult& round) {
  // Validate first so a partial round never lands in the history.
  for (const auto& s : scenarios_) {
    if (round.find(s) == round.end()) {
      throw GateError(ErrorKind::Round, "round " + std::to_string(roundIndex) +
                                            " missing metrics for scenario: " + s);
    }
  }
  for (const auto& s : scenarios_) {
    tracks_[s].samples.push_back(MetricSample{s, roundIndex, round.at(s)});
  }
  ++rounds_;
}

void MetricHistory::recordOutcome(const ScenarioId& scenario, bool pass) {
  auto it = tracks_.find(scenario);
  if (it == tracks_.end()) {
    throw GateError(ErrorKind::Round, "outcome for unknown scenario: " + scenario);
  }
  it->second.outcomes.push_back(pass);
}

const MetricHistory::ScenarioTrack& MetricHistory::track(const ScenarioId& scenario) const {
  auto it = tracks_.find(scenario);
  if (it == tracks_.end()) {
    throw GateError(ErrorKind::Round, "unknown scenario: " + scenario);
  }
  return it->second;
}

const std::vector<MetricSample>& MetricHistory::samples(const ScenarioId& scenario) const {
  return track(scenario).samples;
}

std::vector<double> MetricHistory::series(const ScenarioId& scenario,
                                          double RoundMetrics::*field) const {
  const auto& SAMPLES = track(scenario).samples;
  std::vector<double> out;
  out.reserve(SAMPLES.size());
  for (const auto& sample : SAMPLES) {
    out.push_back(sample.metrics.*field);
  }
  return out;
}

int MetricHistory::passCount(const ScenarioId& scenario) const {
  const auto& OUTCOMES = track(scenario).outcomes;
  return static_cast<int>(std::count(OUTCOMES.begin(), OUTCOMES.end(), true));
}

/* --------------------------------- API --------------------------------- */

bool scoreRound(const RoundMetrics& round, const BaselineEntry& baseline, long memoryHardLimitKb) {
  const double ROUND_CPU_PER_KRPS = cpuPerKiloRps(round.cpuPercent, round.requestsPerSecond);
  return round.requestsPerSecond >= baseline.requestsPerSecond &&
         round.p99LatencyUs <= baseline.p99LatencyUs &&
         ROUND_CPU_PER_KRPS <= baseline.cpuPerKiloRps &&
         round.residentMemoryKb <= static_cast<double>(memoryHardLimitKb);
}

int requiredPassRounds(int executedRounds, double minPassRatio,
                       std::optional<int> minPassRoundsOverride) {
  constexpr double RATIO_SLACK = 1e-3;
  const double RAW = static_cast<double>(executedRounds) * minPassRatio;
  int required = static_cast<int>(std::ceil(RAW - RATIO_SLACK));
  if (required < 0) {
    required = 0;
  }
  if (minPassRoundsOverride && *minPassRoundsOverride > required) {
    required = *minPassRoundsOverride;
  }
  return required;
}

bool hasHighJitter(const MetricHistory& history, double maxCvPercent) {
  for (const auto& s : history.scenarios()) {
    if (cvPercent(history.series(s, &RoundMetrics::requestsPerSecond)) > maxCvPercent) {
      return true;
    }
  }
  return false;
}

bool shouldExtend(int roundIndex, int targetRounds, const GatePolicy& policy,
                  const MetricHistory& history) {
  const int MAX_TOTAL = policy.plannedRounds + policy.maxExtraRounds;
  return roundIndex == targetRounds && targetRounds < MAX_TOTAL &&
         hasHighJitter(history, policy.maxCvPercent);
}

GateVerdict computeVerdict(const MetricHistory& history, const Baseline& baseline,
                           const GatePolicy& policy) {
  GateVerdict verdict;
  verdict.plannedRounds = policy.plannedRounds;
  verdict.roundsExecuted = history.roundsExecuted();
  verdict.requiredPassRounds = requiredPassRounds(history.roundsExecuted(), policy.minPassRatio,
                                                  policy.minPassRoundsOverride);
  verdict.pass = true;

  const double RSS_LIMIT = static_cast<double>(policy.memoryHardLimitKb);

  for (const auto& s : history.scenarios()) {
    auto baseIt = baseline.find(s);
    if (baseIt == baseline.end()) {
      throw GateError(ErrorKind::Setup, "baseline missing scenario: " + s);
    }

    ScenarioVerdict v;
    v.scenario = s;
    v.baseline = baseIt->second;
    v.roundsExecuted = history.roundsExecuted();
    v.passRounds = history.passCount(s);

    const auto RPS = history.series(s, &RoundMetrics::requestsPerSecond);
    v.median.requestsPerSecond = median(RPS);
    v.median.p99LatencyUs = median(history.series(s, &RoundMetrics::p99LatencyUs));
    v.median.cpuPercent = median(history.series(s, &RoundMetrics::cpuPercent));
    v.median.residentMemoryKb = median(history.series(s, &RoundMetrics::residentMemoryKb));
    v.median.cpuPerKiloRps = cpuPerKiloRps(v.median.cpuPercent, v.median.requestsPerSecond);
    v.rpsCvPercent = cvPercent(RPS);

    v.throughputOk = v.median.requestsPerSecond >= v.baseline.requestsPerSecond;
    v.latencyOk = v.median.p99LatencyUs <= v.baseline.p99LatencyUs;
    v.cpuEfficiencyOk = v.median.cpuPerKiloRps <= v.baseline.cpuPerKiloRps;
    v.memoryOk = v.median.residentMemoryKb <= RSS_LIMIT;
    v.quorumOk = v.passRounds >= verdict.requiredPassRounds;
    v.pass = v.throughputOk && v.latencyOk && v.cpuEfficiencyOk && v.memoryOk && v.quorumOk;

    verdict.pass = verdict.pass && v.pass;
    verdict.scenarios.push_back(std::move(v));
  }
  return verdict;
}

GateVerdict runRounds(RoundSource& source, const std::vector<ScenarioId>& scenarios,
                      const Baseline& baseline, const GatePolicy& policy) {
  for (const auto& s : scenarios) {
    if (baseline.find(s) == baseline.end()) {
      throw GateError(ErrorKind::Setup, "baseline missing scenario: " + s);
    }
  }

  MetricHistory history(scenarios);
  int targetRounds = policy.plannedRounds;

  for (int round = 1; round <= targetRounds; ++round) {
    std::printf("[gate] round %d/%d\n", round, targetRounds);
    std::fflush(stdout);

    const RoundResult RESULT = source.runRound(round, targetRounds);
    history.record(round, RESULT);
    for (const auto& s : scenarios) {
      history.recordOutcome(s, scoreRound(RESULT.at(s), baseline.at(s), policy.memoryHardLimitKb));
    }

    if (shouldExtend(round, targetRounds, policy, history)) {
      ++targetRounds;
      std::printf("[gate] detected high RPS jitter (CV > %.1f%%), extending to %d rounds\n",
                  policy.maxCvPercent, targetRounds);
    }
  }

  return computeVerdict(history, baseline, policy);
}

MetricHistory collectRounds(RoundSource& source, const std::vector<ScenarioId>& scenarios,
                            int rounds) {
  MetricHistory history(scenarios);
  for (int round = 1; round <= rounds; ++round) {
    std::printf("[baseline] round %d/%d\n", round, rounds);
    std::fflush(stdout);
    history.record(round, source.runRound(round, rounds));
  }
  return history;
}

} // namespace gate
} // namespace quorum
