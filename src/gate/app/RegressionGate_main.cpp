/**
 * @file RegressionGate_main.cpp
 * @brief quorum_gate_run: one zero-regression gate invocation.
 *
 * Usage:
 *   @code{.sh}
 *   BASELINE_FILE=artifacts/perf/baseline_single_core_1x8_pinned.md ROUNDS=9 quorum_gate_run
 *   @endcode
 *
 * Exit codes: 0 pass, 1 regression, 2 setup error, 3 round error, 4 protocol violation.
 */

#include <cstdio>

#include "src/gate/inc/Gate.hpp"
#include "src/gate/inc/GateError.hpp"
#include "src/gate/inc/Process.hpp"

namespace qg = quorum::gate;

int main() {
  qg::installInterruptHandlers();
  try {
    const qg::GateConfig CFG = qg::loadGateConfigFromEnv();
    const qg::GateOutcome OUT = qg::runGate(CFG);
    return qg::exitCodeFor(OUT);
  } catch (const qg::GateError& e) {
    std::fprintf(stderr, "[ERROR] gate aborted (%s error): %s\n", qg::errorKindName(e.kind()),
                 e.what());
    return qg::exitCodeFor(e.kind());
  } catch (const std::exception& e) {
    std::fprintf(stderr, "[ERROR] gate aborted: %s\n", e.what());
    return qg::EXIT_SETUP_ERROR;
  }
}
