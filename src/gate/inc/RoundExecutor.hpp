#ifndef QUORUM_ROUNDEXECUTOR_HPP
#define QUORUM_ROUNDEXECUTOR_HPP
/**
 * @file RoundExecutor.hpp
 * @brief Production round source: per-scenario service lifecycle, load phase and sampling.
 *
 * For every scenario of a round, strictly in order:
 *   1. start the upstream simulator and wait for its port,
 *   2. write the subject configuration, start the subject, wait for its port and a canary,
 *   3. send discarded warm-up requests,
 *   4. resolve the subject pid, sample CPU/RSS while the load generator runs,
 *   5. assert upstream protocol purity,
 *   6. print the round-log lines, then terminate both services.
 *
 * The round's metrics are parsed back from the printed round-log text.
 *
 * @note NOT RT-safe.
 */

#include <filesystem>
#include <string>
#include <vector>

#include "src/gate/inc/DecisionEngine.hpp"
#include "src/gate/inc/GateConfig.hpp"
#include "src/gate/inc/HttpProbe.hpp"
#include "src/gate/inc/LoadGenerator.hpp"
#include "src/gate/inc/Process.hpp"
#include "src/gate/inc/Scenarios.hpp"

namespace quorum {
namespace gate {

/**
 * @brief RoundSource that drives real processes.
 *
 * Borrows the run-scoped configuration guard and work directory; both must outlive it.
 */
class ServiceRoundSource final : public RoundSource {
public:
  ServiceRoundSource(const GateConfig& cfg, std::vector<ScenarioSpec> scenarios, CorePins pins,
                     ConfigFileGuard& subjectConfig, std::filesystem::path workDir,
                     LoadGenerator& load);

  RoundResult runRound(int roundIndex, int targetRounds) override;

  /**
   * @brief Measure one scenario.
   * @return Its two round-log lines, newline-terminated.
   */
  std::string runScenario(const ScenarioSpec& spec);

private:
  void assertUpstreamPurity(const ScenarioSpec& spec, const std::string& upstreamLog) const;

  const GateConfig& cfg_;
  std::vector<ScenarioSpec> scenarios_;
  std::vector<ScenarioId> ids_;
  CorePins pins_;
  ConfigFileGuard& subjectConfig_;
  std::filesystem::path workDir_;
  LoadGenerator& load_;
  CurlClient curl_;
};

/** @brief Echo the head of a process log to stderr after a fatal condition. */
void dumpLogHead(const std::string& label, const std::string& path);

} // namespace gate
} // namespace quorum

#endif // QUORUM_ROUNDEXECUTOR_HPP
