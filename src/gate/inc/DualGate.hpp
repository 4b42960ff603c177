#ifndef QUORUM_DUALGATE_HPP
#define QUORUM_DUALGATE_HPP
/**
 * @file DualGate.hpp
 * @brief Pinned (blocking) plus unpinned (observational) gate pair with a combined summary.
 *
 * Reports: `<stem>_pinned_latest.md`, `<stem>_unpinned_latest.md` and
 * `zero_regression_dual_gate_latest.md` under the output directory.
 */

#include <functional>
#include <optional>
#include <string>

#include "src/gate/inc/Gate.hpp"
#include "src/gate/inc/GateConfig.hpp"

namespace quorum {
namespace gate {

/* ---------------------------- DualGateConfig ---------------------------- */

/** @brief Settings of both legs; everything else is shared through @ref base. */
struct DualGateConfig {
  GateConfig base{};
  std::string pinnedBaselineFile = "artifacts/perf/baseline_single_core_1x8_pinned.md";
  std::string unpinnedBaselineFile{}; ///< Defaults to the pinned baseline
  int pinnedRounds = 9;
  int unpinnedRounds = 5;
  std::string pinnedDuration = "10s";
  std::string unpinnedDuration{}; ///< Defaults to the pinned duration
  bool skipUnpinned = false;
};

/**
 * @brief Load dual-gate settings: PINNED_BASELINE_FILE, UNPINNED_BASELINE_FILE, PINNED_ROUNDS,
 *        UNPINNED_ROUNDS, PINNED_DURATION, UNPINNED_DURATION, SKIP_UNPINNED_OBSERVE, plus every
 *        single-gate variable for the shared part.
 * @throws GateError(Setup) on malformed values.
 */
DualGateConfig loadDualGateConfig(const EnvLookup& env);

/** @brief Gate configuration of the pinned leg (auto pinning on). */
GateConfig pinnedLegConfig(const DualGateConfig& dual);

/** @brief Gate configuration of the unpinned leg (no pinning of any kind). */
GateConfig unpinnedLegConfig(const DualGateConfig& dual);

/* ----------------------------- DualGateResult ----------------------------- */

/** @brief Observed state of the unpinned leg. */
enum class ObserveState { Skipped, Pass, Fail, Error };

/** @brief Outcome of both legs. */
struct DualGateResult {
  GateOutcome pinned{};
  ObserveState unpinned{ObserveState::Skipped};
  std::string unpinnedError{}; ///< Message when unpinned == Error
  std::string summaryPath{};

  /** @brief Exit code: driven by the pinned leg only. */
  [[nodiscard]] int exitCode() const noexcept { return exitCodeFor(pinned); }
};

/** @brief Runs one gate leg; production passes runGateLocked. */
using GateRunner = std::function<GateOutcome(const GateConfig&)>;

/* --------------------------------- API --------------------------------- */

/**
 * @brief Run the pinned leg, then the unpinned leg, then write the summary.
 *
 * The run lock is held across both legs, so @p runner must not take it again. A fatal error
 * in the pinned leg propagates. A pinned FAIL still runs the unpinned leg and writes the
 * summary. Any unpinned failure or exception is recorded, never raised, unless an interrupt
 * was requested.
 *
 * @throws GateError(Setup) if another invocation holds the run lock.
 */
DualGateResult runDualGate(const DualGateConfig& dual, const GateRunner& runner,
                           const RunMetadata& meta);

/** @brief Render the combined summary. */
std::string renderDualSummary(const DualGateConfig& dual, const DualGateResult& result,
                              const RunMetadata& meta);

} // namespace gate
} // namespace quorum

#endif // QUORUM_DUALGATE_HPP
