/**
 * @file ResourceSampler.cpp
 * @brief procfs readers and the polling sampler.
 */

#include "src/gate/inc/ResourceSampler.hpp"

#include <algorithm>
#include <sstream>
#include <string_view>

#include <csignal>
#include <unistd.h>

#include "src/gate/inc/GateUtils.hpp"

namespace quorum {
namespace gate {

/* ------------------------------ procfs readers ------------------------------ */

std::optional<std::uint64_t> readCpuTicks(pid_t pid, const std::string& procRoot) {
  const std::string STAT = slurp(procRoot + "/" + std::to_string(pid) + "/stat");
  // comm (field 2) may contain spaces; fields after the last ')' start at field 3.
  const std::size_t CLOSE = STAT.rfind(')');
  if (CLOSE == std::string::npos) {
    return std::nullopt;
  }
  std::istringstream rest(STAT.substr(CLOSE + 1));
  std::string field;
  std::uint64_t utime = 0;
  std::uint64_t stime = 0;
  // Field 3 is index 0 here; utime is field 14, stime field 15.
  for (int idx = 0; idx <= 12 && (rest >> field); ++idx) {
    if (idx == 11 || idx == 12) {
      const auto VAL = parseInt(field);
      if (!VAL || *VAL < 0) {
        return std::nullopt;
      }
      (idx == 11 ? utime : stime) = static_cast<std::uint64_t>(*VAL);
      if (idx == 12) {
        return utime + stime;
      }
    }
  }
  return std::nullopt;
}

std::optional<long> readPeakRssKb(pid_t pid, const std::string& procRoot) {
  const std::string STATUS = slurp(procRoot + "/" + std::to_string(pid) + "/status");
  for (const std::string_view LINE : splitLines(STATUS)) {
    constexpr std::string_view KEY = "VmHWM:";
    if (LINE.substr(0, KEY.size()) != KEY) {
      continue;
    }
    std::string_view value = trim(LINE.substr(KEY.size()));
    const std::size_t SPACE = value.find(' ');
    if (SPACE != std::string_view::npos) {
      value = value.substr(0, SPACE);
    }
    const auto KB = parseInt(value);
    if (!KB) {
      return std::nullopt;
    }
    return static_cast<long>(*KB);
  }
  return std::nullopt;
}

double computeCpuPercent(std::uint64_t startTicks, std::uint64_t endTicks, long clkTck,
                         double wallSeconds) {
  if (endTicks <= startTicks || clkTck <= 0 || wallSeconds <= 0.0) {
    return 0.0;
  }
  const double DELTA = static_cast<double>(endTicks - startTicks);
  return DELTA / static_cast<double>(clkTck) * 100.0 / wallSeconds;
}

/* ----------------------------- ResourceSampler ----------------------------- */

ResourceSampler::ResourceSampler(pid_t pid, std::chrono::milliseconds interval,
                                 std::string procRoot)
    : pid_(pid), interval_(interval), procRoot_(std::move(procRoot)),
      clkTck_(::sysconf(_SC_CLK_TCK)) {}

ResourceSampler::~ResourceSampler() {
  running_.store(false);
  if (worker_.joinable()) {
    worker_.join();
  }
}

void ResourceSampler::sampleOnce() {
  const auto TICKS = readCpuTicks(pid_, procRoot_);
  const auto RSS = readPeakRssKb(pid_, procRoot_);
  std::lock_guard<std::mutex> lock(mtx_);
  if (TICKS && *TICKS > 0) {
    lastTicks_ = *TICKS;
  }
  if (RSS) {
    peakRssKb_ = std::max(peakRssKb_, *RSS);
  }
}

void ResourceSampler::start() {
  if (running_.load() || result_) {
    return;
  }
  startTicks_ = readCpuTicks(pid_, procRoot_).value_or(0);
  lastTicks_ = startTicks_;
  peakRssKb_ = readPeakRssKb(pid_, procRoot_).value_or(0);
  startUs_ = nowUs();
  running_.store(true);
  worker_ = std::thread([this] { poll(); });
}

void ResourceSampler::poll() {
  while (running_.load()) {
    sampleOnce();
    if (::kill(pid_, 0) != 0) {
      break;
    }
    std::this_thread::sleep_for(interval_);
  }
}

ResourceUsage ResourceSampler::stop() {
  if (result_) {
    return *result_;
  }
  const double END_US = nowUs();
  running_.store(false);
  if (worker_.joinable()) {
    worker_.join();
  }
  sampleOnce();

  ResourceUsage usage;
  usage.wallSeconds = (END_US - startUs_) / 1e6;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    usage.cpuPercent = computeCpuPercent(startTicks_, lastTicks_, clkTck_, usage.wallSeconds);
    usage.peakRssKb = peakRssKb_;
  }
  result_ = usage;
  return usage;
}

} // namespace gate
} // namespace quorum
