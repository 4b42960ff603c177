#ifndef QUORUM_GATEERROR_HPP
#define QUORUM_GATEERROR_HPP
/**
 * @file GateError.hpp
 * @brief Fatal error taxonomy for gate invocations and the matching process exit codes.
 */

#include <stdexcept>
#include <string>

namespace quorum {
namespace gate {

/* ------------------------------ ErrorKind ------------------------------ */

/** @brief Category of a fatal condition. Regression outcomes are not errors. */
enum class ErrorKind {
  Setup,         ///< Missing binaries, lock contention, bad config, missing baseline scenario
  Round,         ///< Readiness timeout, unparseable metric line, missing round metric
  ProtocolPurity ///< Measured traffic used a fallback upstream transport
};

/** @brief Process exit codes. 1 is reserved for a regression verdict (FAIL). */
enum ExitCode : int {
  EXIT_PASS = 0,
  EXIT_REGRESSION = 1,
  EXIT_SETUP_ERROR = 2,
  EXIT_ROUND_ERROR = 3,
  EXIT_PROTOCOL_ERROR = 4
};

/* ------------------------------ GateError ------------------------------ */

/**
 * @brief Fatal gate error. Thrown, never retried; unwinding releases every scoped resource.
 */
class GateError : public std::runtime_error {
public:
  GateError(ErrorKind kind, const std::string& what) : std::runtime_error(what), kind_(kind) {}

  [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
  ErrorKind kind_;
};

/* --------------------------------- API --------------------------------- */

/** @brief Short stable label for logs ("setup", "round", "protocol"). */
inline const char* errorKindName(ErrorKind kind) noexcept {
  switch (kind) {
  case ErrorKind::Setup:
    return "setup";
  case ErrorKind::Round:
    return "round";
  case ErrorKind::ProtocolPurity:
    return "protocol";
  }
  return "unknown";
}

/** @brief Map an error category to the invocation exit code. */
inline int exitCodeFor(ErrorKind kind) noexcept {
  switch (kind) {
  case ErrorKind::Setup:
    return EXIT_SETUP_ERROR;
  case ErrorKind::Round:
    return EXIT_ROUND_ERROR;
  case ErrorKind::ProtocolPurity:
    return EXIT_PROTOCOL_ERROR;
  }
  return EXIT_SETUP_ERROR;
}

} // namespace gate
} // namespace quorum

#endif // QUORUM_GATEERROR_HPP
