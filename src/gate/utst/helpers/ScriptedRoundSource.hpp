/**
 * @file ScriptedRoundSource.hpp
 * @brief Test round source replaying pre-scripted rounds, plus small fixtures.
 */

#ifndef QUORUM_TEST_SCRIPTED_ROUND_SOURCE_HPP
#define QUORUM_TEST_SCRIPTED_ROUND_SOURCE_HPP

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "src/gate/inc/DecisionEngine.hpp"
#include "src/gate/inc/GateError.hpp"

namespace quorum {
namespace gate {
namespace test {

/**
 * @brief Replays rounds in order; the last scripted round repeats once the script runs out.
 */
class ScriptedRoundSource : public RoundSource {
public:
  explicit ScriptedRoundSource(std::vector<RoundResult> script) : script_(std::move(script)) {}

  RoundResult runRound(int roundIndex, int targetRounds) override {
    calls.push_back(roundIndex);
    targets.push_back(targetRounds);
    if (script_.empty()) {
      throw GateError(ErrorKind::Round, "empty script");
    }
    const std::size_t IDX = static_cast<std::size_t>(roundIndex - 1);
    return IDX < script_.size() ? script_[IDX] : script_.back();
  }

  std::vector<int> calls;   ///< Round indices requested
  std::vector<int> targets; ///< Target round count seen per call

private:
  std::vector<RoundResult> script_;
};

/** @brief Round metrics shorthand. */
inline RoundMetrics metrics(double rps, double p99Us, double cpu, double rssKb) {
  return RoundMetrics{rps, p99Us, cpu, rssKb};
}

/** @brief Same metrics for every scenario of @p ids. */
inline RoundResult uniformRound(const std::vector<ScenarioId>& ids, const RoundMetrics& m) {
  RoundResult r;
  for (const auto& id : ids) {
    r[id] = m;
  }
  return r;
}

/** @brief Unique empty directory under the system temp dir, removed on destruction. */
class ScratchDir {
public:
  explicit ScratchDir(const std::string& name) {
    path_ = std::filesystem::temp_directory_path() /
            (name + "_" + std::to_string(reinterpret_cast<std::uintptr_t>(this)));
    std::filesystem::remove_all(path_);
    std::filesystem::create_directories(path_);
  }
  ~ScratchDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  ScratchDir(const ScratchDir&) = delete;
  ScratchDir& operator=(const ScratchDir&) = delete;

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
};

} // namespace test
} // namespace gate
} // namespace quorum

#endif // QUORUM_TEST_SCRIPTED_ROUND_SOURCE_HPP
