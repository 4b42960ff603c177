#ifndef QUORUM_REPORTWRITER_HPP
#define QUORUM_REPORTWRITER_HPP
/**
 * @file ReportWriter.hpp
 * @brief Markdown gate report and run metadata capture.
 *
 * Each invocation writes `<stem>_<YYYYmmdd_HHMMSS>.md` and overwrites `<stem>_latest.md`.
 * The verdict line is either "PASS: zero-regression contract satisfied." or
 * "FAIL: zero-regression contract violated.".
 */

#include <string>

#include "src/gate/inc/DecisionEngine.hpp"
#include "src/gate/inc/GateConfig.hpp"

namespace quorum {
namespace gate {

/* ----------------------------- Metadata Capture ----------------------------- */

/** @brief Provenance of one run. */
struct RunMetadata {
  std::string date;        ///< "YYYY-mm-dd HH:MM:SS UTC"
  std::string fileStamp;   ///< "YYYYmmdd_HHMMSS" (UTC), used in file names
  std::string hostname;
  std::string gitRevision; ///< `git describe --always --dirty --tags`, or "unknown"
};

/**
 * @brief Capture date, host and git revision.
 * @note NOT RT-safe (spawns git).
 */
RunMetadata captureRunMetadata();

/* --------------------------------- API --------------------------------- */

/** @brief Percentage change from @p base to @p value; 0 when @p base is 0. */
double pctDelta(double base, double value);

inline constexpr const char* PASS_LINE = "PASS: zero-regression contract satisfied.";
inline constexpr const char* FAIL_LINE = "FAIL: zero-regression contract violated.";

/** @brief Render the full report. */
std::string renderGateReport(const GateVerdict& verdict, const GateConfig& cfg,
                             const RunMetadata& meta);

/** @brief Paths written by writeGateReport(). */
struct ReportPaths {
  std::string timestamped;
  std::string latest;
};

/**
 * @brief Write the report under @p outDir (created if needed).
 * @throws GateError(Setup) if either file cannot be written.
 */
ReportPaths writeGateReport(const std::string& report, const std::string& outDir,
                            const std::string& stem, const std::string& fileStamp);

} // namespace gate
} // namespace quorum

#endif // QUORUM_REPORTWRITER_HPP
