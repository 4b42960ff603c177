#ifndef QUORUM_LOADGENERATOR_HPP
#define QUORUM_LOADGENERATOR_HPP
/**
 * @file LoadGenerator.hpp
 * @brief Load-generation backends. Production drives wrk; tests can script the summary text.
 *
 * @note NOT RT-safe (spawns subprocesses, file I/O).
 */

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace quorum {
namespace gate {

/** @brief One load phase against the subject. */
struct LoadRequest {
  std::string url;
  std::string body;          ///< JSON request body
  std::string duration;      ///< wrk duration ("10s")
  double durationSeconds{};  ///< Parsed duration, bounds the run
  int threads = 1;
  int connections = 8;
  std::string timeout = "2s"; ///< Per-request timeout
  std::optional<int> cpuCore{};
};

/**
 * @brief Abstract load generator (Profiler-style facade).
 */
class LoadGenerator {
public:
  virtual ~LoadGenerator() = default;

  /**
   * @brief Run one load phase to completion.
   * @return Raw summary text.
   * @throws GateError(Round) if the tool fails or overruns its duration.
   */
  virtual std::string run(const LoadRequest& request) = 0;
};

/* ---------------------------- WrkLoadGenerator ---------------------------- */

/**
 * @brief wrk backend: POSTs the body with the client key through a generated Lua script.
 */
class WrkLoadGenerator final : public LoadGenerator {
public:
  WrkLoadGenerator(std::string wrkBin, std::filesystem::path scriptDir)
      : wrkBin_(std::move(wrkBin)), scriptDir_(std::move(scriptDir)) {}

  std::string run(const LoadRequest& request) override;

  /** @brief Lua script setting method, headers and body. */
  static std::string renderScript(const std::string& body);

  /** @brief wrk argument vector for @p request using @p scriptPath. */
  std::vector<std::string> commandLine(const LoadRequest& request,
                                       const std::string& scriptPath) const;

private:
  std::string wrkBin_;
  std::filesystem::path scriptDir_;
};

} // namespace gate
} // namespace quorum

#endif // QUORUM_LOADGENERATOR_HPP
