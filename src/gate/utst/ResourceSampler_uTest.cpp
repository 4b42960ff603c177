/**
 * @file ResourceSampler_uTest.cpp
 * @brief Unit tests for procfs readers and the polling resource sampler.
 */

#include "src/gate/inc/ResourceSampler.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <string>
#include <thread>

#include <unistd.h>

#include "src/gate/inc/GateUtils.hpp"
#include "src/gate/inc/Process.hpp"
#include "src/gate/utst/helpers/ScriptedRoundSource.hpp"

using quorum::gate::computeCpuPercent;
using quorum::gate::readCpuTicks;
using quorum::gate::readPeakRssKb;
using quorum::gate::ResourceSampler;
using quorum::gate::ResourceUsage;
using quorum::gate::writeFile;
using quorum::gate::test::ScratchDir;

namespace {

/** @brief Write a fake /proc/<pid>/{stat,status} pair. */
void writeProc(const std::filesystem::path& root, pid_t pid, unsigned utime, unsigned stime,
               long hwmKb) {
  const auto DIR = root / std::to_string(pid);
  std::filesystem::create_directories(DIR);
  // Fields 3..13, then utime (14) and stime (15), then a few trailing fields.
  writeFile(DIR / "stat", std::to_string(pid) + " (proxy d) S 1 1 1 0 -1 4194560 100 0 0 0 " +
                              std::to_string(utime) + " " + std::to_string(stime) +
                              " 0 0 20 0 1 0\n");
  writeFile(DIR / "status", "Name:\tproxyd\nVmPeak:\t  99999 kB\nVmHWM:\t    " +
                                std::to_string(hwmKb) + " kB\nVmRSS:\t    1000 kB\n");
}

} // namespace

/* ----------------------------- Readers ----------------------------- */

/** @test Ticks are utime + stime even when comm contains spaces. */
TEST(ResourceSamplerTest, ReadsTicksAndPeakRss) {
  ScratchDir dir("quorum_sampler_read");
  writeProc(dir.path(), 4242, 120, 30, 5120);
  EXPECT_EQ(readCpuTicks(4242, dir.path().string()), 150u);
  EXPECT_EQ(readPeakRssKb(4242, dir.path().string()), 5120L);
}

/** @test Missing or truncated procfs entries read as absent. */
TEST(ResourceSamplerTest, MissingProcess) {
  ScratchDir dir("quorum_sampler_missing");
  EXPECT_FALSE(readCpuTicks(4242, dir.path().string()).has_value());
  EXPECT_FALSE(readPeakRssKb(4242, dir.path().string()).has_value());

  std::filesystem::create_directories(dir.path() / "7");
  writeFile(dir.path() / "7" / "stat", "7 (x) S 1 1\n");
  writeFile(dir.path() / "7" / "status", "Name:\tx\n");
  EXPECT_FALSE(readCpuTicks(7, dir.path().string()).has_value());
  EXPECT_FALSE(readPeakRssKb(7, dir.path().string()).has_value());
}

/** @test The live reader works on this process. */
TEST(ResourceSamplerTest, ReadsSelf) {
  EXPECT_TRUE(readCpuTicks(::getpid()).has_value());
  const auto RSS = readPeakRssKb(::getpid());
  ASSERT_TRUE(RSS.has_value());
  EXPECT_GT(*RSS, 0);
}

/* ----------------------------- CPU percent ----------------------------- */

/** @test 100 ticks at 100 Hz over 2 s is 50%. */
TEST(ResourceSamplerTest, CpuPercentFormula) {
  EXPECT_DOUBLE_EQ(computeCpuPercent(1000, 1100, 100, 2.0), 50.0);
  EXPECT_DOUBLE_EQ(computeCpuPercent(0, 400, 100, 2.0), 200.0);
}

/** @test Non-advancing ticks and degenerate intervals clamp to zero. */
TEST(ResourceSamplerTest, CpuPercentClamps) {
  EXPECT_DOUBLE_EQ(computeCpuPercent(500, 500, 100, 1.0), 0.0);
  EXPECT_DOUBLE_EQ(computeCpuPercent(500, 400, 100, 1.0), 0.0);
  EXPECT_DOUBLE_EQ(computeCpuPercent(0, 100, 0, 1.0), 0.0);
  EXPECT_DOUBLE_EQ(computeCpuPercent(0, 100, 100, 0.0), 0.0);
}

/* ----------------------------- Sampler ----------------------------- */

/** @test The sampler keeps the maximum peak RSS and the advance of ticks seen during the phase. */
TEST(ResourceSamplerTest, SamplesFakeProcess) {
  ScratchDir dir("quorum_sampler_fake");
  // The fake entry uses our own pid so the liveness check succeeds.
  const pid_t PID = ::getpid();
  writeProc(dir.path(), PID, 100, 0, 4000);

  ResourceSampler sampler(PID, std::chrono::milliseconds(5), dir.path().string());
  sampler.start();
  writeProc(dir.path(), PID, 150, 50, 9000);
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  writeProc(dir.path(), PID, 180, 60, 6000);
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  const ResourceUsage USAGE = sampler.stop();

  EXPECT_EQ(USAGE.peakRssKb, 9000);
  EXPECT_GT(USAGE.cpuPercent, 0.0);
  EXPECT_GT(USAGE.wallSeconds, 0.0);

  // Idempotent.
  const ResourceUsage AGAIN = sampler.stop();
  EXPECT_DOUBLE_EQ(AGAIN.cpuPercent, USAGE.cpuPercent);
  EXPECT_EQ(AGAIN.peakRssKb, USAGE.peakRssKb);
}

/** @test A process that vanishes mid-phase keeps its last observed values. */
TEST(ResourceSamplerTest, KeepsLastValuesAfterExit) {
  ScratchDir dir("quorum_sampler_exit");
  const pid_t PID = ::getpid();
  writeProc(dir.path(), PID, 10, 0, 2048);

  ResourceSampler sampler(PID, std::chrono::milliseconds(5), dir.path().string());
  sampler.start();
  writeProc(dir.path(), PID, 60, 0, 3072);
  std::this_thread::sleep_for(std::chrono::milliseconds(40));
  std::filesystem::remove_all(dir.path() / std::to_string(PID));
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  const ResourceUsage USAGE = sampler.stop();

  EXPECT_EQ(USAGE.peakRssKb, 3072);
  EXPECT_GT(USAGE.cpuPercent, 0.0);
}

/** @test Sampling this process while it spins reports non-zero CPU. */
TEST(ResourceSamplerTest, SamplesLiveBusyProcess) {
  ResourceSampler sampler(::getpid());
  sampler.start();
  const auto DEADLINE = std::chrono::steady_clock::now() + std::chrono::milliseconds(300);
  volatile unsigned long long spin = 0;
  while (std::chrono::steady_clock::now() < DEADLINE) {
    spin = spin + 1;
  }
  const ResourceUsage USAGE = sampler.stop();
  EXPECT_GT(USAGE.cpuPercent, 0.0);
  EXPECT_GT(USAGE.peakRssKb, 0);
}

/** @test A busy /bin/sh child is sampled while it runs. */
TEST(ResourceSamplerTest, SamplesShellChild) {
  quorum::gate::SpawnOptions opts;
  opts.argv = {"/bin/sh", "-c", "i=0; while [ $i -lt 300000 ]; do i=$((i+1)); done"};
  quorum::gate::ChildProcess child = quorum::gate::ChildProcess::spawn(opts);

  ResourceSampler sampler(child.pid());
  sampler.start();
  const auto CODE = child.waitFor(std::chrono::seconds(30));
  const ResourceUsage USAGE = sampler.stop();

  ASSERT_TRUE(CODE.has_value());
  EXPECT_EQ(*CODE, 0);
  EXPECT_GT(USAGE.cpuPercent, 0.0);
  EXPECT_GT(USAGE.peakRssKb, 0);
}
