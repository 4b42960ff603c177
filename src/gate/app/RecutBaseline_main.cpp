/**
 * @file RecutBaseline_main.cpp
 * @brief quorum_recut_baseline: record a fresh baseline snapshot (medians of ROUNDS rounds).
 *
 * Writes OUT_FILE when set, otherwise BASELINE_FILE.
 */

#include <cstdio>
#include <cstdlib>
#include <string>

#include "src/gate/inc/Gate.hpp"
#include "src/gate/inc/GateError.hpp"
#include "src/gate/inc/Process.hpp"

namespace qg = quorum::gate;

int main() {
  qg::installInterruptHandlers();
  try {
    const qg::GateConfig CFG = qg::loadGateConfigFromEnv();
    const char* outFile = std::getenv("OUT_FILE");
    const std::string TARGET =
        (outFile != nullptr && *outFile != '\0') ? std::string(outFile) : CFG.baselineFile;
    qg::runRecut(CFG, TARGET);
    return qg::EXIT_PASS;
  } catch (const qg::GateError& e) {
    std::fprintf(stderr, "[ERROR] baseline recut aborted (%s error): %s\n",
                 qg::errorKindName(e.kind()), e.what());
    return qg::exitCodeFor(e.kind());
  } catch (const std::exception& e) {
    std::fprintf(stderr, "[ERROR] baseline recut aborted: %s\n", e.what());
    return qg::EXIT_SETUP_ERROR;
  }
}
