#ifndef QUORUM_RESOURCESAMPLER_HPP
#define QUORUM_RESOURCESAMPLER_HPP
/**
 * @file ResourceSampler.hpp
 * @brief CPU tick and peak-RSS sampling of a running process through procfs.
 *
 * A background thread polls the target on a fixed interval for the duration of a load
 * phase, retaining the last non-zero cumulative tick count and the maximum peak RSS, so a
 * process that exits mid-phase still reports the values observed last.
 *
 * @note NOT RT-safe (file I/O, thread creation).
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <sys/types.h>

namespace quorum {
namespace gate {

/* --------------------------------- API --------------------------------- */

/**
 * @brief Cumulative user+system CPU ticks of a process (/proc/<pid>/stat fields 14 and 15).
 * @return nullopt if the process is gone or the stat line is malformed.
 */
std::optional<std::uint64_t> readCpuTicks(pid_t pid, const std::string& procRoot = "/proc");

/**
 * @brief Peak resident set size in KB (VmHWM from /proc/<pid>/status).
 * @return nullopt if unavailable.
 */
std::optional<long> readPeakRssKb(pid_t pid, const std::string& procRoot = "/proc");

/**
 * @brief CPU percent over a wall interval: (end - start) / clkTck * 100 / wallSeconds.
 *
 * Clamped to 0 when ticks did not advance or the interval is degenerate.
 */
double computeCpuPercent(std::uint64_t startTicks, std::uint64_t endTicks, long clkTck,
                         double wallSeconds);

/* ---------------------------- ResourceUsage ---------------------------- */

/** @brief Result of one sampled phase. */
struct ResourceUsage {
  double cpuPercent{};
  long peakRssKb{};
  double wallSeconds{};
};

/* ---------------------------- ResourceSampler ---------------------------- */

/**
 * @brief Samples one process between start() and stop().
 *
 * start() takes the initial tick reading synchronously, so sampling never begins after the
 * measured phase. stop() joins the poller and takes a final reading.
 */
class ResourceSampler {
public:
  static constexpr std::chrono::milliseconds DEFAULT_INTERVAL{20};

  explicit ResourceSampler(pid_t pid, std::chrono::milliseconds interval = DEFAULT_INTERVAL,
                           std::string procRoot = "/proc");
  ~ResourceSampler();

  ResourceSampler(const ResourceSampler&) = delete;
  ResourceSampler& operator=(const ResourceSampler&) = delete;

  void start();

  /** @brief Stop polling and compute the phase usage. Idempotent after the first call. */
  ResourceUsage stop();

  [[nodiscard]] pid_t pid() const noexcept { return pid_; }

private:
  void poll();
  void sampleOnce();

  pid_t pid_;
  std::chrono::milliseconds interval_;
  std::string procRoot_;
  long clkTck_;

  std::atomic<bool> running_{false};
  std::thread worker_;
  std::mutex mtx_;

  std::uint64_t startTicks_ = 0;
  std::uint64_t lastTicks_ = 0;
  long peakRssKb_ = 0;
  double startUs_ = 0.0;
  std::optional<ResourceUsage> result_{};
};

} // namespace gate
} // namespace quorum

#endif // QUORUM_RESOURCESAMPLER_HPP
