#ifndef QUORUM_GATETYPES_HPP
#define QUORUM_GATETYPES_HPP
/**
 * @file GateTypes.hpp
 * @brief Core value types of the regression gate: samples, baseline entries, derived metrics.
 */

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "src/gate/inc/GateUtils.hpp"

namespace quorum {
namespace gate {

/** @brief Opaque scenario identifier (e.g. "forward_stream_wrk"). Order is insertion order. */
using ScenarioId = std::string;

/* ------------------------------ Metrics ------------------------------ */

/** @brief Metrics of one scenario in one round. */
struct RoundMetrics {
  double requestsPerSecond{};
  double p99LatencyUs{};
  double cpuPercent{};
  double residentMemoryKb{};
};

/** @brief One observation, produced exactly once per (scenario, round). */
struct MetricSample {
  ScenarioId scenario;
  int roundIndex{};
  RoundMetrics metrics{};
};

/** @brief Metrics of every scenario in one round, keyed by scenario. */
using RoundResult = std::map<ScenarioId, RoundMetrics>;

/** @brief Recorded known-good metrics for one scenario. Immutable during a run. */
struct BaselineEntry {
  double requestsPerSecond{};
  double p99LatencyUs{};
  double cpuPercent{};
  double residentMemoryKb{};
  double cpuPerKiloRps{};
};

/** @brief Baseline entries keyed by scenario. */
using Baseline = std::map<ScenarioId, BaselineEntry>;

/* --------------------------------- API --------------------------------- */

/**
 * @brief CPU cost per thousand requests per second: cpu% * 1000 / rps.
 * @return 0.0 when @p rps is zero.
 */
inline double cpuPerKiloRps(double cpuPercent, double requestsPerSecond) {
  if (requestsPerSecond == 0.0) {
    return 0.0;
  }
  return cpuPercent * 1000.0 / requestsPerSecond;
}

/**
 * @brief Normalize a unit-suffixed latency ("1.25ms", "830.00us", "2s", "900ns") to microseconds.
 *
 * Spaces are ignored and units are case-insensitive. The numeric part must be an unsigned
 * decimal (`[0-9]+(\.[0-9]+)?`). "n/a", empty strings and unknown units yield nullopt.
 */
inline std::optional<double> parseLatencyUs(std::string_view raw) {
  const std::string S = toLower(stripChars(raw, " \t"));
  if (S.empty() || S == "n/a") {
    return std::nullopt;
  }

  const std::size_t NUMBER_LEN = decimalPrefixLength(S);
  if (NUMBER_LEN == 0) {
    return std::nullopt;
  }

  const std::string_view UNIT = std::string_view(S).substr(NUMBER_LEN);
  double factor = 0.0;
  if (UNIT == "ns") {
    factor = 0.001;
  } else if (UNIT == "us") {
    factor = 1.0;
  } else if (UNIT == "ms") {
    factor = 1000.0;
  } else if (UNIT == "s") {
    factor = 1000000.0;
  } else {
    return std::nullopt;
  }

  const auto VALUE = parseUnsignedDecimal(std::string_view(S).substr(0, NUMBER_LEN));
  if (!VALUE) {
    return std::nullopt;
  }
  return *VALUE * factor;
}

/** @brief Build a baseline entry, deriving cpu-per-kilo-rps from the raw values. */
inline BaselineEntry makeBaselineEntry(double rps, double p99Us, double cpuPercent, double rssKb) {
  return BaselineEntry{rps, p99Us, cpuPercent, rssKb, cpuPerKiloRps(cpuPercent, rps)};
}

} // namespace gate
} // namespace quorum

#endif // QUORUM_GATETYPES_HPP
