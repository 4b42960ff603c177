#ifndef QUORUM_GATECONFIG_HPP
#define QUORUM_GATECONFIG_HPP
/**
 * @file GateConfig.hpp
 * @brief Gate tunables and an environment-style loader.
 *
 * Every knob has a documented default; the loader overrides from environment
 * variables and reports malformed values as setup errors instead of exiting.
 */

#include <cstdio>
#include <cstdlib>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

#include "src/gate/inc/GateError.hpp"
#include "src/gate/inc/GateUtils.hpp"

namespace quorum {
namespace gate {

/* ----------------------------- GatePolicy ----------------------------- */

/** @brief Decision parameters. Loaded once, immutable for the run. */
struct GatePolicy {
  int plannedRounds = 9;                        ///< Rounds executed before any jitter extension
  double minPassRatio = 0.7778;                 ///< Quorum: fraction of rounds that must pass
  std::optional<int> minPassRoundsOverride{};   ///< Explicit quorum floor (raises, never lowers)
  double maxCvPercent = 5.0;                    ///< RPS jitter threshold (CV%)
  int maxExtraRounds = 3;                       ///< Cap on jitter-triggered extra rounds
  std::string duration = "10s";                 ///< Load-generation wall time per scenario
  long memoryHardLimitKb = 10240;               ///< Absolute peak RSS ceiling
};

/* ------------------------------ CorePins ------------------------------ */

/** @brief Optional CPU assignment per cooperating process. */
struct CorePins {
  std::optional<int> subject{};
  std::optional<int> upstream{};
  std::optional<int> loadGenerator{};
};

/* ----------------------------- GateConfig ----------------------------- */

/** @brief Complete gate configuration (environment-overridable). */
struct GateConfig {
  GatePolicy policy{};

  std::string baselineFile = "artifacts/perf/baseline_single_core_1x8_pinned.md";
  std::string outDir = "artifacts/perf";
  std::string reportStem = "zero_regression_gate"; ///< Report file name prefix
  bool includeAliasRemap = false;                  ///< Add the alias-remap scenario group

  // ---- Core affinity ----
  bool autoPinCores = false; ///< Fill unset pins with subject=0, upstream=1, wrk=2
  CorePins pins{};

  // ---- Collaborators ----
  std::string subjectBin = "target/release/toolify";
  std::string subjectName = "toolify";      ///< Recognizable process name of the subject
  std::string subjectConfig = "config.yaml"; ///< Shared configuration file read by the subject
  std::string mockUpstreamBin = "target/release/mock_openai_upstream";
  std::string wrkBin = "wrk";
  std::string curlBin = "curl";

  // ---- Fixed single-core 1x8 profile ----
  int wrkThreads = 1;
  int connections = 8;
  int workerThreads = 1;
  std::string wrkTimeout = "2s";

  // ---- Ports, readiness and warm-up ----
  int proxyPort = 18080;
  int upstreamPort = 19001;
  int startupTimeoutS = 10;
  int warmupRequests = 200;
  int warmupConnectTimeoutS = 2;
  int warmupMaxTimeS = 2;

  // ---- Upstream simulator ----
  std::string upstreamTransport = "h2c"; ///< "h2c" | "auto"
  bool requireUpstreamH2 = true;         ///< Fail on any fallback-transport traffic
  std::string mockScenario = "text";     ///< "text" | "code" | "full" | "error"

  std::string lockFile = "/tmp/quorum_gate.lock";
};

/** @brief Name of the fixed benchmark profile, e.g. "single_core_1x8". */
inline std::string profileName(const GateConfig& cfg) {
  return "single_core_" + std::to_string(cfg.wrkThreads) + "x" + std::to_string(cfg.connections);
}

/* --------------------------------- API --------------------------------- */

/** @brief Environment lookup; returns nullptr for unset variables. */
using EnvLookup = std::function<const char*(const char*)>;

/**
 * @brief Parse a load-generator duration ("10", "10s", "2m", "1h") into seconds.
 * @return nullopt for malformed or non-positive durations.
 */
inline std::optional<double> parseDurationSeconds(std::string_view text) {
  const std::string S = toLower(trim(text));
  if (S.empty()) {
    return std::nullopt;
  }
  double scale = 1.0;
  std::string_view number = S;
  switch (S.back()) {
  case 's':
    number.remove_suffix(1);
    break;
  case 'm':
    scale = 60.0;
    number.remove_suffix(1);
    break;
  case 'h':
    scale = 3600.0;
    number.remove_suffix(1);
    break;
  default:
    break;
  }
  const auto VAL = parseDouble(number);
  if (!VAL || *VAL <= 0.0) {
    return std::nullopt;
  }
  return *VAL * scale;
}

/**
 * @brief Resolve the effective core pins.
 *
 * With auto pinning on and at least two online CPUs, unset pins default to
 * subject=0, upstream=1 and load generator=2 (0 when only two CPUs exist).
 */
inline CorePins effectivePins(const GateConfig& cfg, long onlineCpus) {
  CorePins pins = cfg.pins;
  if (!cfg.autoPinCores || onlineCpus < 2) {
    return pins;
  }
  if (!pins.subject) {
    pins.subject = 0;
  }
  if (!pins.upstream) {
    pins.upstream = 1;
  }
  if (!pins.loadGenerator) {
    pins.loadGenerator = (onlineCpus >= 3) ? 2 : 0;
  }
  return pins;
}

namespace detail {

/** @brief Typed readers over an EnvLookup; malformed values raise setup errors. */
class EnvReader {
public:
  explicit EnvReader(const EnvLookup& env) : env_(env) {}

  [[nodiscard]] std::optional<std::string> str(const char* name) const {
    const char* raw = env_ ? env_(name) : nullptr;
    if (raw == nullptr || *raw == '\0') {
      return std::nullopt;
    }
    return std::string(raw);
  }

  void read(const char* name, std::string& out) const {
    if (auto v = str(name)) {
      out = *v;
    }
  }

  void read(const char* name, int& out) const {
    if (auto v = str(name)) {
      out = narrowInt(name, integer(name, *v));
    }
  }

  void read(const char* name, long& out) const {
    if (auto v = str(name)) {
      out = static_cast<long>(integer(name, *v));
    }
  }

  void read(const char* name, double& out) const {
    if (auto v = str(name)) {
      const auto VAL = parseDouble(*v);
      if (!VAL) {
        throw GateError(ErrorKind::Setup, std::string(name) + " is not a number: " + *v);
      }
      out = *VAL;
    }
  }

  void read(const char* name, std::optional<int>& out) const {
    if (auto v = str(name)) {
      out = narrowInt(name, integer(name, *v));
    }
  }

  void readFlag(const char* name, bool& out) const {
    if (auto v = str(name)) {
      if (*v == "1") {
        out = true;
      } else if (*v == "0") {
        out = false;
      } else {
        throw GateError(ErrorKind::Setup, std::string(name) + " must be 0 or 1, got: " + *v);
      }
    }
  }

private:
  static long long integer(const char* name, const std::string& v) {
    const auto VAL = parseInt(v);
    if (!VAL) {
      throw GateError(ErrorKind::Setup, std::string(name) + " is not an integer: " + v);
    }
    return *VAL;
  }

  static int narrowInt(const char* name, long long v) {
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
      throw GateError(ErrorKind::Setup,
                      std::string(name) + " is out of range: " + std::to_string(v));
    }
    return static_cast<int>(v);
  }

  const EnvLookup& env_;
};

} // namespace detail

/**
 * @brief Validate cross-field constraints.
 * @throws GateError(Setup) on the first violation.
 */
inline void validateGateConfig(const GateConfig& cfg) {
  const auto reject = [](const std::string& msg) { throw GateError(ErrorKind::Setup, msg); };
  const GatePolicy& p = cfg.policy;

  if (p.plannedRounds < 1) {
    reject("ROUNDS must be >= 1");
  }
  if (!(p.minPassRatio > 0.0 && p.minPassRatio <= 1.0)) {
    reject("MIN_PASS_RATIO must be in (0, 1]");
  }
  if (p.minPassRoundsOverride && *p.minPassRoundsOverride < 0) {
    reject("MIN_PASS_ROUNDS must be >= 0");
  }
  if (p.maxCvPercent < 0.0) {
    reject("MAX_CV_PERCENT must be >= 0");
  }
  if (p.maxExtraRounds < 0) {
    reject("MAX_EXTRA_ROUNDS must be >= 0");
  }
  if (!parseDurationSeconds(p.duration)) {
    reject("DURATION is not a valid duration: " + p.duration);
  }
  if (p.memoryHardLimitKb <= 0) {
    reject("RSS_LIMIT_KB must be > 0");
  }
  if (cfg.upstreamTransport != "h2c" && cfg.upstreamTransport != "auto") {
    reject("unknown UPSTREAM_TRANSPORT: " + cfg.upstreamTransport + " (use auto|h2c)");
  }
  if (cfg.mockScenario != "text" && cfg.mockScenario != "code" && cfg.mockScenario != "full" &&
      cfg.mockScenario != "error") {
    reject("unknown MOCK_SCENARIO: " + cfg.mockScenario + " (use text|code|full|error)");
  }
  if (cfg.workerThreads != 1 || cfg.wrkThreads != 1 || cfg.connections != 8) {
    reject("this profile is fixed to worker_threads=1, wrk_threads=1 and connections=8");
  }
  if (cfg.startupTimeoutS <= 0) {
    reject("STARTUP_TIMEOUT_S must be > 0");
  }
  if (cfg.warmupRequests < 0) {
    reject("WARMUP_REQUESTS must be >= 0");
  }
}

/**
 * @brief Load configuration from environment-style parameters.
 *
 * Recognized variables:
 *   BASELINE_FILE  ROUNDS  MIN_PASS_ROUNDS  MIN_PASS_RATIO  MAX_CV_PERCENT
 *   MAX_EXTRA_ROUNDS  DURATION  RSS_LIMIT_KB  OUT_DIR  INCLUDE_ALIAS_REMAP_SCENARIO
 *   AUTO_PIN_CORES  PIN_PROXY_CORE  PIN_UPSTREAM_CORE  PIN_WRK_CORE
 *   SUBJECT_BIN  SUBJECT_NAME  SUBJECT_CONFIG  MOCK_UPSTREAM_BIN  WRK_BIN  CURL_BIN
 *   WRK_THREADS  CONNECTIONS  WORKER_THREADS  WRK_TIMEOUT  PROXY_PORT  UPSTREAM_PORT
 *   STARTUP_TIMEOUT_S  WARMUP_REQUESTS  UPSTREAM_TRANSPORT  REQUIRE_UPSTREAM_H2
 *   MOCK_SCENARIO  LOCK_FILE
 *
 * @param env  Lookup function (std::getenv in production).
 * @param base Starting values (defaults unless a caller pre-seeds them).
 * @throws GateError(Setup) on malformed or inconsistent values.
 */
inline GateConfig loadGateConfig(const EnvLookup& env, GateConfig base = {}) {
  const detail::EnvReader R(env);
  GateConfig cfg = std::move(base);

  R.read("BASELINE_FILE", cfg.baselineFile);
  R.read("ROUNDS", cfg.policy.plannedRounds);
  R.read("MIN_PASS_ROUNDS", cfg.policy.minPassRoundsOverride);
  R.read("MIN_PASS_RATIO", cfg.policy.minPassRatio);
  R.read("MAX_CV_PERCENT", cfg.policy.maxCvPercent);
  R.read("MAX_EXTRA_ROUNDS", cfg.policy.maxExtraRounds);
  R.read("DURATION", cfg.policy.duration);
  R.read("RSS_LIMIT_KB", cfg.policy.memoryHardLimitKb);
  R.read("OUT_DIR", cfg.outDir);
  R.readFlag("INCLUDE_ALIAS_REMAP_SCENARIO", cfg.includeAliasRemap);

  R.readFlag("AUTO_PIN_CORES", cfg.autoPinCores);
  R.read("PIN_PROXY_CORE", cfg.pins.subject);
  R.read("PIN_UPSTREAM_CORE", cfg.pins.upstream);
  R.read("PIN_WRK_CORE", cfg.pins.loadGenerator);

  R.read("SUBJECT_BIN", cfg.subjectBin);
  R.read("SUBJECT_NAME", cfg.subjectName);
  R.read("SUBJECT_CONFIG", cfg.subjectConfig);
  R.read("MOCK_UPSTREAM_BIN", cfg.mockUpstreamBin);
  R.read("WRK_BIN", cfg.wrkBin);
  R.read("CURL_BIN", cfg.curlBin);

  R.read("WRK_THREADS", cfg.wrkThreads);
  R.read("CONNECTIONS", cfg.connections);
  R.read("WORKER_THREADS", cfg.workerThreads);
  R.read("WRK_TIMEOUT", cfg.wrkTimeout);
  R.read("PROXY_PORT", cfg.proxyPort);
  R.read("UPSTREAM_PORT", cfg.upstreamPort);
  R.read("STARTUP_TIMEOUT_S", cfg.startupTimeoutS);
  R.read("WARMUP_REQUESTS", cfg.warmupRequests);
  R.read("UPSTREAM_TRANSPORT", cfg.upstreamTransport);
  R.readFlag("REQUIRE_UPSTREAM_H2", cfg.requireUpstreamH2);
  R.read("MOCK_SCENARIO", cfg.mockScenario);
  R.read("LOCK_FILE", cfg.lockFile);

  validateGateConfig(cfg);
  return cfg;
}

/** @brief Load configuration from the process environment. */
inline GateConfig loadGateConfigFromEnv() {
  return loadGateConfig([](const char* name) -> const char* { return std::getenv(name); });
}

/** @brief Print the effective configuration (one line per group). */
inline void printGateConfig(const GateConfig& cfg, std::FILE* out = stdout) {
  const GatePolicy& p = cfg.policy;
  std::fprintf(out,
               "[gate] profile=%s rounds=%d extra<=%d duration=%s cv<=%.2f%% ratio=%.4f "
               "min_pass=%s rss_limit_kb=%ld\n",
               profileName(cfg).c_str(), p.plannedRounds, p.maxExtraRounds, p.duration.c_str(),
               p.maxCvPercent, p.minPassRatio,
               p.minPassRoundsOverride ? std::to_string(*p.minPassRoundsOverride).c_str() : "-",
               p.memoryHardLimitKb);
  std::fprintf(out, "[gate] baseline=%s out_dir=%s alias_remap=%d auto_pin=%d\n",
               cfg.baselineFile.c_str(), cfg.outDir.c_str(), cfg.includeAliasRemap ? 1 : 0,
               cfg.autoPinCores ? 1 : 0);
}

} // namespace gate
} // namespace quorum

#endif // QUORUM_GATECONFIG_HPP
