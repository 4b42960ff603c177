/**
 * @file ProcessTree.cpp
 * @brief procfs process view and wrapper resolution walk.
 */

#include "src/gate/inc/ProcessTree.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>

#include "src/gate/inc/GateUtils.hpp"

namespace quorum {
namespace gate {

/* ----------------------------- ProcfsTreeView ----------------------------- */

std::optional<std::string> ProcfsTreeView::processName(pid_t pid) const {
  std::ifstream comm(procRoot_ + "/" + std::to_string(pid) + "/comm");
  if (!comm) {
    return std::nullopt;
  }
  std::string name;
  if (!std::getline(comm, name)) {
    return std::nullopt;
  }
  return std::string(trim(name));
}

std::vector<pid_t> ProcfsTreeView::children(pid_t pid) const {
  // Scan /proc/<n>/stat for ppid; /proc/<pid>/task/*/children needs CONFIG_PROC_CHILDREN.
  std::vector<pid_t> out;
  std::error_code ec;
  for (const auto& entry : std::filesystem::directory_iterator(procRoot_, ec)) {
    const std::string NAME = entry.path().filename().string();
    const auto CHILD = parseInt(NAME);
    if (!CHILD) {
      continue;
    }
    const std::string STAT = slurp(entry.path() / "stat");
    // Format: "<pid> (<comm>) <state> <ppid> ..."; comm may contain spaces or parens.
    const std::size_t CLOSE = STAT.rfind(')');
    if (CLOSE == std::string::npos || CLOSE + 2 >= STAT.size()) {
      continue;
    }
    std::size_t pos = CLOSE + 2;
    const std::size_t STATE_END = STAT.find(' ', pos);
    if (STATE_END == std::string::npos) {
      continue;
    }
    pos = STATE_END + 1;
    const std::size_t PPID_END = STAT.find(' ', pos);
    const auto PPID = parseInt(std::string_view(STAT).substr(pos, PPID_END - pos));
    if (PPID && *PPID == pid) {
      out.push_back(static_cast<pid_t>(*CHILD));
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

/* ---------------------------- WrapperResolver ---------------------------- */

bool WrapperResolver::isWrapper(const std::string& name) const {
  return std::find(wrapperNames_.begin(), wrapperNames_.end(), name) != wrapperNames_.end();
}

ResolveStep WrapperResolver::step(const ProcessTreeView& view, pid_t pid) const {
  const auto NAME = view.processName(pid);
  if (!NAME) {
    return {ResolveStep::Kind::Stop, {}};
  }
  if (*NAME == subjectName_) {
    return {ResolveStep::Kind::Target, {}};
  }
  if (!isWrapper(*NAME)) {
    return {ResolveStep::Kind::Stop, {}};
  }
  auto kids = view.children(pid);
  if (kids.empty()) {
    return {ResolveStep::Kind::Stop, {}};
  }
  return {ResolveStep::Kind::Descend, std::move(kids)};
}

pid_t WrapperResolver::select(const ProcessTreeView& view,
                              const std::vector<pid_t>& candidates) const {
  for (const pid_t C : candidates) {
    if (view.processName(C) == subjectName_) {
      return C;
    }
  }
  for (const pid_t C : candidates) {
    const auto NAME = view.processName(C);
    if (NAME && !isWrapper(*NAME)) {
      return C;
    }
  }
  return candidates.front();
}

pid_t WrapperResolver::resolve(const ProcessTreeView& view, pid_t launcherPid) const {
  pid_t pid = launcherPid;
  for (int depth = 0; depth < maxDepth_; ++depth) {
    const ResolveStep STEP = step(view, pid);
    if (STEP.kind != ResolveStep::Kind::Descend) {
      break;
    }
    pid = select(view, STEP.candidates);
  }
  return pid;
}

} // namespace gate
} // namespace quorum
