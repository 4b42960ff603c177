#ifndef QUORUM_BASELINESTORE_HPP
#define QUORUM_BASELINESTORE_HPP
/**
 * @file BaselineStore.hpp
 * @brief Parser/writer pair for the tabular baseline snapshot.
 *
 * Grammar (Markdown):
 * @code
 * <preamble lines>
 *
 * ## Results
 *
 * | Scenario | RPS | p99 | Avg Latency | CPU | RSS | Notes |
 * |---|---:|---:|---:|---:|---:|---|
 * | `forward_nonstream_wrk` | 1234.56 | 1.25ms | n/a | 87.50% | 5120KB | median of 9 rounds |
 * @endcode
 *
 * Only rows inside the section titled exactly "Results" are read. A row is recognized only
 * when its CPU cell contains '%' and its RSS cell contains "KB". Every other line (the table
 * header, notes between rows, later sections) is kept verbatim, and rows keep their source
 * line, so a parsed document renders back byte-for-byte until its rows are edited.
 */

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "src/gate/inc/GateTypes.hpp"

namespace quorum {
namespace gate {

/* ----------------------------- BaselineRow ----------------------------- */

/** @brief One Results row, cells kept verbatim (trimmed). */
struct BaselineRow {
  std::string scenario;   ///< Name without the surrounding backticks
  std::string rps;        ///< e.g. "1234.56" (thousands separators allowed)
  std::string p99;        ///< Unit-suffixed latency
  std::string avgLatency; ///< Unused placeholder column ("n/a")
  std::string cpu;        ///< Percent-suffixed, e.g. "87.50%"
  std::string rss;        ///< Kilobyte-suffixed, e.g. "5120KB"
  std::string notes;      ///< Free text

  std::vector<std::string> leading{}; ///< Non-row lines directly above this row in Results
  std::string source{}; ///< Line the row was parsed from; re-emitted while the cells match
};

/** @brief Default lines between "## Results" and the first row of a fresh snapshot. */
inline std::vector<std::string> defaultTableHead() {
  return {"", "| Scenario | RPS | p99 | Avg Latency | CPU | RSS | Notes |",
          "|---|---:|---:|---:|---:|---:|---|"};
}

/**
 * @brief Whole snapshot.
 *
 * Layout: preamble, "## Results", tableHead, rows (each preceded by its leading lines), trailer.
 */
struct BaselineDocument {
  std::vector<std::string> preamble{}; ///< Lines before "## Results", verbatim
  std::vector<std::string> tableHead = defaultTableHead();
  std::vector<BaselineRow> rows{};
  std::vector<std::string> trailer{}; ///< Lines after the last row, later sections included
  bool hasResults = true;             ///< false when the text had no "## Results" heading
  bool finalNewline = true;           ///< Text ended with '\n'
};

/* --------------------------------- API --------------------------------- */

/** @brief Parse the document structure. Unrecognized rows are skipped, never guessed. */
BaselineDocument parseBaselineDocument(std::string_view text);

/** @brief Render a document back to text (inverse of parseBaselineDocument). */
std::string renderBaselineDocument(const BaselineDocument& doc);

/**
 * @brief Convert a row's cells to numbers.
 * @return nullopt if any of rps, p99, cpu or rss is malformed.
 */
std::optional<BaselineEntry> toBaselineEntry(const BaselineRow& row);

/**
 * @brief Parse baseline entries for the given scenario set.
 *
 * Rows for scenarios outside the set are ignored.
 *
 * @throws GateError(Setup) if a scenario in the set is absent or its row is malformed.
 */
Baseline parseBaseline(std::string_view text, const std::vector<ScenarioId>& scenarios);

/**
 * @brief Read and parse a baseline file.
 * @throws GateError(Setup) if the file is missing or unreadable, or per parseBaseline().
 */
Baseline loadBaseline(const std::string& path, const std::vector<ScenarioId>& scenarios);

/**
 * @brief Format a fresh Results row from per-scenario medians.
 *
 * p99 is rendered in milliseconds ("%.2fms"), CPU as "%.2f%%", RSS as "%.0fKB".
 */
BaselineRow makeBaselineRow(const ScenarioId& scenario, double rps, double p99Us, double cpuPercent,
                            double rssKb, int rounds);

/** @brief Write a document to disk (parent directories created). */
void writeBaselineDocument(const std::string& path, const BaselineDocument& doc);

} // namespace gate
} // namespace quorum

#endif // QUORUM_BASELINESTORE_HPP
