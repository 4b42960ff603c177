#ifndef QUORUM_ROUNDLOG_HPP
#define QUORUM_ROUNDLOG_HPP
/**
 * @file RoundLog.hpp
 * @brief Text contracts of a round: load-generator summary, round-log lines, upstream stats.
 *
 * Round-log lines, one of each per scenario per round:
 * @code
 * <scenario> wrk_requests=<int> wrk_rps=<float> wrk_p99=<latency> wrk_latency_avg=<latency|n/a>
 * <scenario> cpu_pct=<float> peak_rss_kb=<int>
 * @endcode
 *
 * The executor prints these lines and derives the round's metrics by parsing its own output,
 * so the textual contract and the decision input never diverge.
 */

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "src/gate/inc/GateTypes.hpp"

namespace quorum {
namespace gate {

/* ------------------------------ WrkSummary ------------------------------ */

/** @brief Fields scraped from wrk's human-readable summary. Absent fields stay nullopt. */
struct WrkSummary {
  std::optional<long long> totalRequests{}; ///< "<N> requests in ..." (last match)
  std::optional<double> requestsPerSecond{};  ///< "Requests/sec: <x>" (last match)
  std::optional<std::string> p99{};           ///< "99% <latency>" in the distribution (last)
  std::optional<std::string> latencyAvg{};    ///< "Latency <avg> ..." thread stats (first)
};

/** @brief Scrape a wrk --latency summary. */
WrkSummary parseWrkSummary(std::string_view output);

/* ---------------------------- Round-log lines ---------------------------- */

/** @brief Parsed load line. */
struct LoadLine {
  ScenarioId scenario;
  long long requests{};
  double requestsPerSecond{};
  double p99LatencyUs{};
  std::optional<double> latencyAvgUs{};
};

/** @brief Parsed resource line. */
struct ResourceLine {
  ScenarioId scenario;
  double cpuPercent{};
  long peakRssKb{};
};

/** @brief Render a load line; missing summary fields print as 0 or n/a. */
std::string formatLoadLine(const ScenarioId& scenario, const WrkSummary& summary);

/** @brief Render a resource line ("cpu_pct=%.2f peak_rss_kb=%ld"). */
std::string formatResourceLine(const ScenarioId& scenario, double cpuPercent, long peakRssKb);

/** @return nullopt unless every field of a load line parses. */
std::optional<LoadLine> parseLoadLine(std::string_view line);

/** @return nullopt unless every field of a resource line parses. */
std::optional<ResourceLine> parseResourceLine(std::string_view line);

/**
 * @brief Extract one round's metrics for @p scenarios from round-log text.
 *
 * Lines for other scenarios and unrelated lines are ignored; the last line of each kind wins.
 *
 * @throws GateError(Round) if a scenario's load or resource line is missing or malformed
 *         (including an unparseable p99 latency).
 */
RoundResult parseRoundLog(std::string_view text, const std::vector<ScenarioId>& scenarios);

/* ---------------------------- Upstream stats ---------------------------- */

/** @brief Requests served by the upstream simulator per transport. */
struct UpstreamStats {
  long long h1{};
  long long h2{};
};

/** @brief Read integer fields "h1" and "h2" from the stats JSON object. */
std::optional<UpstreamStats> parseUpstreamStats(std::string_view json);

/** @brief All measured traffic used HTTP/2 and none fell back to HTTP/1.1. */
inline bool isPureH2(const UpstreamStats& stats) noexcept { return stats.h2 > 0 && stats.h1 == 0; }

} // namespace gate
} // namespace quorum

#endif // QUORUM_ROUNDLOG_HPP
