#ifndef QUORUM_SCENARIOS_HPP
#define QUORUM_SCENARIOS_HPP
/**
 * @file Scenarios.hpp
 * @brief Workload catalogue: request payloads and the subject configuration per scenario.
 */

#include <string>
#include <utility>
#include <vector>

#include "src/gate/inc/GateConfig.hpp"
#include "src/gate/inc/GateTypes.hpp"

namespace quorum {
namespace gate {

/** @brief Upstream service layout written into the subject configuration. */
enum class UpstreamTopology {
  Single,    ///< One service serving model "m1"
  AliasGroup ///< Two services behind alias "smart" (smart:m1, smart:m2)
};

/** @brief Reproducible workload shape. */
struct ScenarioSpec {
  ScenarioId id;
  bool stream{};      ///< Request a streamed response
  bool injectTools{}; ///< Carry tool definitions (function-calling injection path)
  std::string model;
  UpstreamTopology topology{UpstreamTopology::Single};
};

/**
 * @brief Fixed scenario set, in execution order.
 *
 * forward_{nonstream,stream}_wrk, fc_inject_{nonstream,stream}_wrk, and with
 * @p includeAliasRemap the alias_remap_{nonstream,stream}_wrk group.
 */
std::vector<ScenarioSpec> defaultScenarios(bool includeAliasRemap);

/** @brief Ids of @p specs, same order. */
std::vector<ScenarioId> scenarioIds(const std::vector<ScenarioSpec>& specs);

/** @brief Chat-completions JSON body for one scenario. */
std::string requestPayload(const ScenarioSpec& spec);

/** @brief Subject YAML for one scenario under @p cfg (ports, transport, topology). */
std::string renderSubjectConfig(const ScenarioSpec& spec, const GateConfig& cfg);

/** @brief Environment overrides for the upstream simulator. */
std::vector<std::pair<std::string, std::string>> upstreamEnvironment(const ScenarioSpec& spec,
                                                                     const GateConfig& cfg);

} // namespace gate
} // namespace quorum

#endif // QUORUM_SCENARIOS_HPP
