#ifndef QUORUM_GATE_HPP
#define QUORUM_GATE_HPP
/**
 * @file Gate.hpp
 * @brief Entry points: one gate invocation and one baseline recut.
 *
 * The `...With` variants take an injected RoundSource; the plain variants acquire the run
 * lock, verify collaborators, create the run-scoped resources and drive real services.
 * runGateLocked() does the same for a caller that already holds the lock.
 *
 * @note NOT RT-safe.
 */

#include <string>
#include <vector>

#include "src/gate/inc/BaselineStore.hpp"
#include "src/gate/inc/DecisionEngine.hpp"
#include "src/gate/inc/GateConfig.hpp"
#include "src/gate/inc/ReportWriter.hpp"

namespace quorum {
namespace gate {

/** @brief Verdict plus where its report went. */
struct GateOutcome {
  GateVerdict verdict{};
  ReportPaths report{};
};

/** @brief EXIT_PASS or EXIT_REGRESSION. */
inline int exitCodeFor(const GateOutcome& outcome) noexcept {
  return outcome.verdict.pass ? EXIT_PASS : EXIT_REGRESSION;
}

/**
 * @brief Run rounds from @p source, decide, and write the report.
 * @throws GateError on any fatal condition (no report is written then).
 */
GateOutcome runGateWith(RoundSource& source, const GateConfig& cfg,
                        const std::vector<ScenarioId>& scenarios, const Baseline& baseline,
                        const RunMetadata& meta);

/**
 * @brief Full production gate invocation under the run lock.
 * @throws GateError(Setup) if another invocation holds cfg.lockFile.
 */
GateOutcome runGate(const GateConfig& cfg);

/** @brief As runGate(), for a caller already holding the run lock (the dual gate). */
GateOutcome runGateLocked(const GateConfig& cfg);

/**
 * @brief Baseline snapshot from collected rounds: exact medians per raw metric.
 */
BaselineDocument buildBaselineSnapshot(const MetricHistory& history, const GateConfig& cfg,
                                       const RunMetadata& meta);

/**
 * @brief Collect cfg.policy.plannedRounds rounds from @p source and write a snapshot.
 * @return The written document.
 */
BaselineDocument runRecutWith(RoundSource& source, const GateConfig& cfg,
                              const std::vector<ScenarioId>& scenarios, const RunMetadata& meta,
                              const std::string& outFile);

/** @brief Full production recut into @p outFile. */
BaselineDocument runRecut(const GateConfig& cfg, const std::string& outFile);

} // namespace gate
} // namespace quorum

#endif // QUORUM_GATE_HPP
