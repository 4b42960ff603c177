#ifndef QUORUM_PROCESSTREE_HPP
#define QUORUM_PROCESSTREE_HPP
/**
 * @file ProcessTree.hpp
 * @brief Resolve the real subject process behind wrapper processes (shells, pinning wrappers).
 *
 * The resolver is a bounded walk over a step function: given a process, the step
 * reports "target", "descend into these children" or "stop". It knows nothing about
 * which wrapper programs exist beyond the configured names.
 */

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <sys/types.h>

namespace quorum {
namespace gate {

/* ---------------------------- ProcessTreeView ---------------------------- */

/**
 * @brief Read-only view of the process table.
 */
class ProcessTreeView {
public:
  virtual ~ProcessTreeView() = default;

  /** @return recognizable process name (comm), or nullopt if the process is gone. */
  virtual std::optional<std::string> processName(pid_t pid) const = 0;

  /** @return direct children, ascending pid order. */
  virtual std::vector<pid_t> children(pid_t pid) const = 0;
};

/**
 * @brief procfs-backed view (Linux).
 */
class ProcfsTreeView final : public ProcessTreeView {
public:
  explicit ProcfsTreeView(std::string procRoot = "/proc") : procRoot_(std::move(procRoot)) {}

  std::optional<std::string> processName(pid_t pid) const override;
  std::vector<pid_t> children(pid_t pid) const override;

private:
  std::string procRoot_;
};

/* ---------------------------- WrapperResolver ---------------------------- */

/** @brief Result of one resolution step. */
struct ResolveStep {
  enum class Kind { Target, Descend, Stop };
  Kind kind{Kind::Stop};
  std::vector<pid_t> candidates{}; ///< Children to continue with (Kind::Descend only)
};

/**
 * @brief Bounded descendant walk from a launcher pid to the subject process.
 *
 * Per step: a process named like the subject is the target; a known wrapper descends to
 * its children, preferring a child named like the subject, else the first non-wrapper
 * child, else the first child; anything else stops the walk. After @p maxDepth steps the
 * walk gives up and returns the last pid it held.
 */
class WrapperResolver {
public:
  static constexpr int DEFAULT_MAX_DEPTH = 8;

  explicit WrapperResolver(std::string subjectName,
                           std::vector<std::string> wrapperNames = {"bash", "sh", "taskset"},
                           int maxDepth = DEFAULT_MAX_DEPTH)
      : subjectName_(std::move(subjectName)), wrapperNames_(std::move(wrapperNames)),
        maxDepth_(maxDepth) {}

  /** @brief Classify one process. */
  [[nodiscard]] ResolveStep step(const ProcessTreeView& view, pid_t pid) const;

  /** @brief Walk from @p launcherPid; always returns a concrete pid. */
  [[nodiscard]] pid_t resolve(const ProcessTreeView& view, pid_t launcherPid) const;

  [[nodiscard]] bool isWrapper(const std::string& name) const;

private:
  pid_t select(const ProcessTreeView& view, const std::vector<pid_t>& candidates) const;

  std::string subjectName_;
  std::vector<std::string> wrapperNames_;
  int maxDepth_;
};

} // namespace gate
} // namespace quorum

#endif // QUORUM_PROCESSTREE_HPP
