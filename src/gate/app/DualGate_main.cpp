/**
 * @file DualGate_main.cpp
 * @brief quorum_dual_gate: pinned blocking gate plus unpinned observational gate.
 *
 * The exit status reflects the pinned gate only.
 */

#include <cstdio>
#include <cstdlib>

#include "src/gate/inc/DualGate.hpp"
#include "src/gate/inc/GateError.hpp"
#include "src/gate/inc/Process.hpp"

namespace qg = quorum::gate;

int main() {
  qg::installInterruptHandlers();
  try {
    const qg::DualGateConfig DUAL = qg::loadDualGateConfig(
        [](const char* name) -> const char* { return std::getenv(name); });
    const qg::RunMetadata META = qg::captureRunMetadata();
    const qg::DualGateResult RESULT = qg::runDualGate(DUAL, qg::runGateLocked, META);
    return RESULT.exitCode();
  } catch (const qg::GateError& e) {
    std::fprintf(stderr, "[ERROR] dual gate aborted (%s error): %s\n",
                 qg::errorKindName(e.kind()), e.what());
    return qg::exitCodeFor(e.kind());
  } catch (const std::exception& e) {
    std::fprintf(stderr, "[ERROR] dual gate aborted: %s\n", e.what());
    return qg::EXIT_SETUP_ERROR;
  }
}
