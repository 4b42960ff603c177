/**
 * @file ReportWriter.cpp
 * @brief Report rendering and metadata capture.
 */

#include "src/gate/inc/ReportWriter.hpp"

#include <array>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>

#include <unistd.h> // gethostname

#include "src/gate/inc/GateError.hpp"
#include "src/gate/inc/GateUtils.hpp"
#include "src/gate/inc/Process.hpp"

namespace quorum {
namespace gate {

namespace {

std::string formatUtc(const std::tm& tm, const char* fmt) {
  std::array<char, 64> buf{};
  std::strftime(buf.data(), buf.size(), fmt, &tm);
  return std::string(buf.data());
}

std::string captureGitRevision() {
  if (!findExecutable("git")) {
    return "unknown";
  }
  const CommandResult R = runCommand({"git", "describe", "--always", "--dirty", "--tags"},
                                     std::chrono::milliseconds(5000));
  const std::string REV(trim(R.output));
  if (R.exitCode != 0 || REV.empty()) {
    return "unknown";
  }
  return REV;
}

std::string captureHostname() {
  std::array<char, 256> buf{};
  if (::gethostname(buf.data(), buf.size()) == 0) {
    buf.back() = '\0';
    return std::string(buf.data());
  }
  return "unknown";
}

/** @brief printf into a std::string. */
template <typename... Args> std::string fmt(const char* format, Args... args) {
  const int N = std::snprintf(nullptr, 0, format, args...);
  if (N <= 0) {
    return {};
  }
  std::string out(static_cast<std::size_t>(N) + 1, '\0');
  std::snprintf(out.data(), out.size(), format, args...);
  out.resize(static_cast<std::size_t>(N));
  return out;
}

std::string failedChecks(const ScenarioVerdict& v, int required) {
  std::string out;
  const auto ADD = [&out](const std::string& s) { out += out.empty() ? s : ", " + s; };
  if (!v.throughputOk) {
    ADD("throughput");
  }
  if (!v.latencyOk) {
    ADD("p99");
  }
  if (!v.cpuEfficiencyOk) {
    ADD("cpu/kRPS");
  }
  if (!v.memoryOk) {
    ADD("memory cap");
  }
  if (!v.quorumOk) {
    ADD(fmt("quorum %d/%d", v.passRounds, required));
  }
  return out;
}

} // namespace

/* ----------------------------- Metadata Capture ----------------------------- */

RunMetadata captureRunMetadata() {
  const std::time_t NOW = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  gmtime_r(&NOW, &tm);

  RunMetadata meta;
  meta.date = formatUtc(tm, "%Y-%m-%d %H:%M:%S UTC");
  meta.fileStamp = formatUtc(tm, "%Y%m%d_%H%M%S");
  meta.hostname = captureHostname();
  meta.gitRevision = captureGitRevision();
  return meta;
}

/* --------------------------------- API --------------------------------- */

double pctDelta(double base, double value) {
  if (base == 0.0) {
    return 0.0;
  }
  return (value - base) / base * 100.0;
}

std::string renderGateReport(const GateVerdict& verdict, const GateConfig& cfg,
                             const RunMetadata& meta) {
  const GatePolicy& p = cfg.policy;
  std::string md;
  md += "# Zero Regression Gate Result\n\n";
  md += "- Date: " + meta.date + "\n";
  md += "- Host: " + meta.hostname + "\n";
  md += "- Revision: `" + meta.gitRevision + "`\n";
  md += "- Baseline: `" + cfg.baselineFile + "`\n";
  md += fmt("- Profile: single-core `%dx%d`\n", cfg.wrkThreads, cfg.connections);
  md += fmt("- Core pinning: %s\n", cfg.autoPinCores ? "auto" : "explicit pins only");
  md += fmt("- Rounds planned: %d\n", verdict.plannedRounds);
  md += fmt("- Rounds executed: %d\n", verdict.roundsExecuted);
  md += fmt("- Extra rounds allowed: %d\n", p.maxExtraRounds);
  md += fmt("- Round duration: %s\n", p.duration.c_str());
  md += fmt("- Jitter threshold (RPS CV): %.2f%%\n", p.maxCvPercent);
  md += fmt("- Min passing rounds per scenario: %d/%d (ratio=%.4f)\n", verdict.requiredPassRounds,
            verdict.roundsExecuted, p.minPassRatio);
  md += fmt("- RSS limit: %ld KB\n", p.memoryHardLimitKb);
  md += "- Upstream transport: " + cfg.upstreamTransport +
        (cfg.requireUpstreamH2 ? " (pure h2 required)" : "") + "\n";
  md += "- Contract priority: p99 (no regression) -> throughput (no regression) -> CPU "
        "efficiency (no regression) -> memory cap\n\n";

  md += "| Scenario | Baseline RPS | Median RPS | ΔRPS% | RPS CV% | Baseline p99(us) | Median "
        "p99(us) | Δp99% | Baseline CPU% | Median CPU% | ΔCPU% | Baseline CPU/kRPS | Median "
        "CPU/kRPS | ΔCPU/kRPS% | Baseline RSS KB | Median RSS KB | ΔRSS% | Pass Rounds |\n";
  md += "|---|---:|---:|---:|---:|---:|---:|---:|---:|---:|---:|---:|---:|---:|---:|---:|---:|---:|"
        "\n";
  for (const auto& v : verdict.scenarios) {
    const BaselineEntry& b = v.baseline;
    const MetricMedians& m = v.median;
    md += fmt("| `%s` | %.2f | %.2f | %.2f%% | %.2f | %.2f | %.2f | %.2f%% | %.2f | %.2f | %.2f%% "
              "| %.4f | %.4f | %.2f%% | %.0f | %.0f | %.2f%% | %d/%d |\n",
              v.scenario.c_str(), b.requestsPerSecond, m.requestsPerSecond,
              pctDelta(b.requestsPerSecond, m.requestsPerSecond), v.rpsCvPercent, b.p99LatencyUs,
              m.p99LatencyUs, pctDelta(b.p99LatencyUs, m.p99LatencyUs), b.cpuPercent,
              m.cpuPercent, pctDelta(b.cpuPercent, m.cpuPercent), b.cpuPerKiloRps,
              m.cpuPerKiloRps, pctDelta(b.cpuPerKiloRps, m.cpuPerKiloRps), b.residentMemoryKb,
              m.residentMemoryKb, pctDelta(b.residentMemoryKb, m.residentMemoryKb), v.passRounds,
              v.roundsExecuted);
  }

  if (!verdict.pass) {
    md += "\n## Failing Scenarios\n\n";
    for (const auto& v : verdict.scenarios) {
      if (!v.pass) {
        md += "- `" + v.scenario + "`: " + failedChecks(v, verdict.requiredPassRounds) + "\n";
      }
    }
  }

  md += "\n## Verdict\n\n";
  md += verdict.pass ? PASS_LINE : FAIL_LINE;
  md += "\n";
  return md;
}

ReportPaths writeGateReport(const std::string& report, const std::string& outDir,
                            const std::string& stem, const std::string& fileStamp) {
  std::error_code ec;
  std::filesystem::create_directories(outDir, ec);
  if (ec) {
    throw GateError(ErrorKind::Setup, "cannot create " + outDir + ": " + ec.message());
  }
  const std::filesystem::path DIR(outDir);
  ReportPaths paths{(DIR / (stem + "_" + fileStamp + ".md")).string(),
                    (DIR / (stem + "_latest.md")).string()};
  if (!writeFile(paths.timestamped, report)) {
    throw GateError(ErrorKind::Setup, "cannot write report " + paths.timestamped);
  }
  if (!writeFile(paths.latest, report)) {
    throw GateError(ErrorKind::Setup, "cannot write report " + paths.latest);
  }
  return paths;
}

} // namespace gate
} // namespace quorum
