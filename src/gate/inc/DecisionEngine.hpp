#ifndef QUORUM_DECISIONENGINE_HPP
#define QUORUM_DECISIONENGINE_HPP
/**
 * @file DecisionEngine.hpp
 * @brief Regression decision engine: per-round scoring, quorum, jitter extension, verdict.
 *
 * A round passes for a scenario iff, against that scenario's baseline:
 *   rps >= base.rps, p99 <= base.p99, cpu/kRPS <= base.cpu/kRPS, rss <= hard limit.
 *
 * After the planned rounds, if any scenario's RPS CV% strictly exceeds the jitter
 * threshold, one extra round is run and the check repeats, up to
 * plannedRounds + maxExtraRounds in total.
 *
 * The final verdict applies the same four comparisons to the exact medians (cpu/kRPS is
 * derived from median CPU% and median RPS) plus the pass-round quorum.
 */

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "src/gate/inc/GateConfig.hpp"
#include "src/gate/inc/GateTypes.hpp"

namespace quorum {
namespace gate {

/* ----------------------------- MetricHistory ----------------------------- */

/**
 * @brief Owned per-scenario ordered record of samples and round outcomes.
 *
 * Appended once per round, never mutated. Every round must carry a sample for every
 * scenario in the fixed set.
 */
class MetricHistory {
public:
  explicit MetricHistory(std::vector<ScenarioId> scenarios);

  /**
   * @brief Append one round's samples.
   * @throws GateError(Round) if any scenario of the set is missing from @p round.
   */
  void record(int roundIndex, const RoundResult& round);

  /** @brief Append the pass/fail outcome of the latest round for one scenario. */
  void recordOutcome(const ScenarioId& scenario, bool pass);

  [[nodiscard]] const std::vector<ScenarioId>& scenarios() const noexcept { return scenarios_; }
  [[nodiscard]] int roundsExecuted() const noexcept { return rounds_; }

  /** @brief Samples of one scenario in round order. */
  [[nodiscard]] const std::vector<MetricSample>& samples(const ScenarioId& scenario) const;

  /** @brief One metric of one scenario across rounds, in round order. */
  [[nodiscard]] std::vector<double> series(const ScenarioId& scenario,
                                           double RoundMetrics::*field) const;

  /** @brief Number of individually passing rounds for one scenario. */
  [[nodiscard]] int passCount(const ScenarioId& scenario) const;

private:
  struct ScenarioTrack {
    std::vector<MetricSample> samples;
    std::vector<bool> outcomes;
  };

  const ScenarioTrack& track(const ScenarioId& scenario) const;

  std::vector<ScenarioId> scenarios_;
  std::map<ScenarioId, ScenarioTrack> tracks_;
  int rounds_ = 0;
};

/* ------------------------------- Verdict ------------------------------- */

/** @brief Exact medians over all executed rounds. */
struct MetricMedians {
  double requestsPerSecond{};
  double p99LatencyUs{};
  double cpuPercent{};
  double residentMemoryKb{};
  double cpuPerKiloRps{}; ///< cpuPerKiloRps(median cpu, median rps)
};

/** @brief Final decision for one scenario. */
struct ScenarioVerdict {
  ScenarioId scenario;
  BaselineEntry baseline{};
  MetricMedians median{};
  double rpsCvPercent{};
  int passRounds{};
  int roundsExecuted{};

  bool throughputOk{};
  bool latencyOk{};
  bool cpuEfficiencyOk{};
  bool memoryOk{};
  bool quorumOk{};
  bool pass{};
};

/** @brief Final decision for the whole gate (AND over scenarios). */
struct GateVerdict {
  std::vector<ScenarioVerdict> scenarios; ///< Scenario insertion order
  int plannedRounds{};
  int roundsExecuted{};
  int requiredPassRounds{};
  bool pass{};
};

/* ------------------------------ RoundSource ------------------------------ */

/**
 * @brief Producer of one measurement round (real services in production, scripted in tests).
 */
class RoundSource {
public:
  virtual ~RoundSource() = default;

  /**
   * @brief Execute round @p roundIndex (1-based) of currently @p targetRounds.
   * @throws GateError on any fatal condition; partial data is never returned.
   */
  virtual RoundResult runRound(int roundIndex, int targetRounds) = 0;
};

/* --------------------------------- API --------------------------------- */

/** @brief Score one round against the baseline (all four comparisons must hold). */
bool scoreRound(const RoundMetrics& round, const BaselineEntry& baseline, long memoryHardLimitKb);

/**
 * @brief Quorum size: max(ceil(executedRounds * minPassRatio), override).
 *
 * The ratio is configured with four decimals (0.7778 for 7/9), so the ceiling ignores an
 * excess below 1e-3 rounds: 9 rounds at 0.7778 require 7, not 8.
 */
int requiredPassRounds(int executedRounds, double minPassRatio,
                       std::optional<int> minPassRoundsOverride);

/** @brief True iff some scenario's RPS CV% strictly exceeds @p maxCvPercent. */
bool hasHighJitter(const MetricHistory& history, double maxCvPercent);

/**
 * @brief Literal round-extension rule, evaluated once after each round.
 *
 * Extends by one only when the last planned round just finished, the cap
 * (planned + maxExtra) is not reached, and jitter is high.
 */
bool shouldExtend(int roundIndex, int targetRounds, const GatePolicy& policy,
                  const MetricHistory& history);

/** @brief Compute the final verdict from the accumulated history. */
GateVerdict computeVerdict(const MetricHistory& history, const Baseline& baseline,
                           const GatePolicy& policy);

/**
 * @brief Drive the full round loop (planned rounds plus bounded jitter extension).
 * @throws GateError(Setup) if the baseline lacks a scenario (before any round runs).
 * @throws GateError from @p source or from a round with missing samples.
 */
GateVerdict runRounds(RoundSource& source, const std::vector<ScenarioId>& scenarios,
                      const Baseline& baseline, const GatePolicy& policy);

/**
 * @brief Run exactly @p rounds rounds with no scoring (used to record a baseline).
 * @return History with samples only.
 */
MetricHistory collectRounds(RoundSource& source, const std::vector<ScenarioId>& scenarios,
                            int rounds);

} // namespace gate
} // namespace quorum

#endif // QUORUM_DECISIONENGINE_HPP
