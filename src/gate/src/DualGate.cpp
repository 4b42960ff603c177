/**
 * @file DualGate.cpp
 * @brief Dual-gate coordination.
 */

#include "src/gate/inc/DualGate.hpp"

#include <cstdio>
#include <exception>
#include <filesystem>

#include "src/gate/inc/GateError.hpp"
#include "src/gate/inc/GateUtils.hpp"
#include "src/gate/inc/Process.hpp"

namespace quorum {
namespace gate {

namespace {

constexpr const char* SUMMARY_NAME = "zero_regression_dual_gate_latest.md";

/** @brief Copy a leg's latest report to its leg-specific name. */
std::string preserveReport(const GateOutcome& outcome, const GateConfig& cfg,
                           const std::string& leg) {
  const std::filesystem::path TARGET =
      std::filesystem::path(cfg.outDir) / (cfg.reportStem + "_" + leg + "_latest.md");
  std::error_code ec;
  std::filesystem::copy_file(outcome.report.latest, TARGET,
                             std::filesystem::copy_options::overwrite_existing, ec);
  if (ec) {
    throw GateError(ErrorKind::Setup, "cannot preserve " + leg + " report as " + TARGET.string() +
                                          ": " + ec.message());
  }
  return TARGET.string();
}

const char* observeLabel(ObserveState s) {
  switch (s) {
  case ObserveState::Skipped:
    return "skipped";
  case ObserveState::Pass:
    return "PASS (observe)";
  case ObserveState::Fail:
    return "FAIL (observe-only, non-blocking)";
  case ObserveState::Error:
    return "ERROR (observe-only, non-blocking)";
  }
  return "unknown";
}

} // namespace

/* ---------------------------- DualGateConfig ---------------------------- */

DualGateConfig loadDualGateConfig(const EnvLookup& env) {
  DualGateConfig dual;
  dual.base = loadGateConfig(env);

  const detail::EnvReader R(env);
  R.read("PINNED_BASELINE_FILE", dual.pinnedBaselineFile);
  dual.unpinnedBaselineFile = dual.pinnedBaselineFile;
  R.read("UNPINNED_BASELINE_FILE", dual.unpinnedBaselineFile);
  R.read("PINNED_ROUNDS", dual.pinnedRounds);
  R.read("UNPINNED_ROUNDS", dual.unpinnedRounds);
  R.read("PINNED_DURATION", dual.pinnedDuration);
  dual.unpinnedDuration = dual.pinnedDuration;
  R.read("UNPINNED_DURATION", dual.unpinnedDuration);
  R.readFlag("SKIP_UNPINNED_OBSERVE", dual.skipUnpinned);

  validateGateConfig(pinnedLegConfig(dual));
  validateGateConfig(unpinnedLegConfig(dual));
  return dual;
}

GateConfig pinnedLegConfig(const DualGateConfig& dual) {
  GateConfig cfg = dual.base;
  cfg.autoPinCores = true;
  cfg.baselineFile = dual.pinnedBaselineFile;
  cfg.policy.plannedRounds = dual.pinnedRounds;
  cfg.policy.duration = dual.pinnedDuration;
  return cfg;
}

GateConfig unpinnedLegConfig(const DualGateConfig& dual) {
  GateConfig cfg = dual.base;
  cfg.autoPinCores = false;
  cfg.pins = CorePins{};
  cfg.baselineFile = dual.unpinnedBaselineFile;
  cfg.policy.plannedRounds = dual.unpinnedRounds;
  cfg.policy.duration = dual.unpinnedDuration;
  return cfg;
}

/* --------------------------------- API --------------------------------- */

DualGateResult runDualGate(const DualGateConfig& dual, const GateRunner& runner,
                           const RunMetadata& meta) {
  const RunLock LOCK(dual.base.lockFile);
  DualGateResult result;

  std::printf("[dual-gate] pinned hard gate start\n");
  std::fflush(stdout);
  const GateConfig PINNED = pinnedLegConfig(dual);
  result.pinned = runner(PINNED);
  preserveReport(result.pinned, PINNED, "pinned");

  if (!dual.skipUnpinned) {
    std::printf("[dual-gate] unpinned observe gate start (non-blocking)\n");
    std::fflush(stdout);
    const GateConfig UNPINNED = unpinnedLegConfig(dual);
    try {
      const GateOutcome OUT = runner(UNPINNED);
      preserveReport(OUT, UNPINNED, "unpinned");
      result.unpinned = OUT.verdict.pass ? ObserveState::Pass : ObserveState::Fail;
    } catch (const GateError& e) {
      if (interruptRequested()) {
        throw;
      }
      std::fprintf(stderr, "[WARN] unpinned observe gate aborted (%s error): %s\n",
                   errorKindName(e.kind()), e.what());
      result.unpinned = ObserveState::Error;
      result.unpinnedError = e.what();
    } catch (const std::exception& e) {
      if (interruptRequested()) {
        throw;
      }
      std::fprintf(stderr, "[WARN] unpinned observe gate aborted: %s\n", e.what());
      result.unpinned = ObserveState::Error;
      result.unpinnedError = e.what();
    }
  }

  const std::filesystem::path SUMMARY = std::filesystem::path(dual.base.outDir) / SUMMARY_NAME;
  const std::string TEXT = renderDualSummary(dual, result, meta);
  if (!writeFile(SUMMARY, TEXT)) {
    throw GateError(ErrorKind::Setup, "cannot write " + SUMMARY.string());
  }
  result.summaryPath = SUMMARY.string();
  std::fputs(TEXT.c_str(), stdout);
  std::fflush(stdout);
  return result;
}

std::string renderDualSummary(const DualGateConfig& dual, const DualGateResult& result,
                              const RunMetadata& meta) {
  const std::filesystem::path OUT(dual.base.outDir);
  const std::string STEM = dual.base.reportStem;
  std::string md;
  md += "# Dual Perf Gate\n\n";
  md += "- Date: " + meta.date + "\n";
  md += "- Pinned baseline: `" + dual.pinnedBaselineFile + "`\n";
  md += "- Unpinned baseline: `" + dual.unpinnedBaselineFile + "`\n";
  md += "- Pinned rounds/duration: " + std::to_string(dual.pinnedRounds) + " / " +
        dual.pinnedDuration + "\n";
  md += "- Unpinned rounds/duration: " + std::to_string(dual.unpinnedRounds) + " / " +
        dual.unpinnedDuration + "\n";
  md += "- Pinned output: `" + (OUT / (STEM + "_pinned_latest.md")).string() + "`\n";
  md += std::string("- Pinned verdict: ") +
        (result.pinned.verdict.pass ? "PASS (blocking)" : "FAIL (blocking)") + "\n";
  if (result.unpinned == ObserveState::Skipped) {
    md += "- Unpinned output: skipped\n";
  } else {
    if (result.unpinned != ObserveState::Error) {
      md += "- Unpinned output: `" + (OUT / (STEM + "_unpinned_latest.md")).string() + "`\n";
    }
    md += std::string("- Unpinned verdict: ") + observeLabel(result.unpinned) + "\n";
    if (result.unpinned == ObserveState::Error) {
      md += "- Unpinned error: " + result.unpinnedError + "\n";
    }
  }
  md += "\n## Contract\n\n";
  md += "- Pinned gate is blocking.\n";
  md += "- Unpinned gate is observational and never blocks merge.\n";
  return md;
}

} // namespace gate
} // namespace quorum
