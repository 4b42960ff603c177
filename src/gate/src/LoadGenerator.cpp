/**
 * @file LoadGenerator.cpp
 * @brief wrk invocation.
 */

#include "src/gate/inc/LoadGenerator.hpp"

#include <chrono>
#include <cstdio>

#include "src/gate/inc/GateError.hpp"
#include "src/gate/inc/GateUtils.hpp"
#include "src/gate/inc/Process.hpp"

namespace quorum {
namespace gate {

namespace {

/** @brief Grace on top of the load duration before wrk is considered hung. */
constexpr long long OVERRUN_GRACE_MS = 30000;

std::string luaQuote(const std::string& s) {
  std::string out = "'";
  for (const char C : s) {
    if (C == '\\' || C == '\'') {
      out.push_back('\\');
    }
    out.push_back(C);
  }
  out.push_back('\'');
  return out;
}

} // namespace

std::string WrkLoadGenerator::renderScript(const std::string& body) {
  return "wrk.method = \"POST\"\n"
         "wrk.headers[\"Authorization\"] = \"Bearer sk-client\"\n"
         "wrk.headers[\"Content-Type\"] = \"application/json\"\n"
         "wrk.body = " +
         luaQuote(body) + "\n";
}

std::vector<std::string> WrkLoadGenerator::commandLine(const LoadRequest& request,
                                                       const std::string& scriptPath) const {
  return {wrkBin_,
          "-t" + std::to_string(request.threads),
          "-c" + std::to_string(request.connections),
          "-d" + request.duration,
          "--timeout",
          request.timeout,
          "--latency",
          "-s",
          scriptPath,
          request.url};
}

std::string WrkLoadGenerator::run(const LoadRequest& request) {
  const std::string SCRIPT = (scriptDir_ / "wrk.lua").string();
  if (!writeFile(SCRIPT, renderScript(request.body))) {
    throw GateError(ErrorKind::Setup, "cannot write wrk script: " + SCRIPT);
  }

  const auto BUDGET = std::chrono::milliseconds(
      static_cast<long long>(request.durationSeconds * 1000.0) + OVERRUN_GRACE_MS);
  const CommandResult R =
      runCommand(commandLine(request, SCRIPT), BUDGET, request.cpuCore, /*captureStderr=*/true);
  std::fputs(R.output.c_str(), stdout);
  std::fflush(stdout);

  if (R.timedOut) {
    throw GateError(ErrorKind::Round, "wrk did not finish within " +
                                          std::to_string(BUDGET.count()) + "ms");
  }
  if (R.exitCode != 0) {
    throw GateError(ErrorKind::Round, "wrk exited with status " + std::to_string(R.exitCode));
  }
  return R.output;
}

} // namespace gate
} // namespace quorum
