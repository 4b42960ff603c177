/**
 * @file HttpProbe.cpp
 * @brief curl invocations for readiness, warm-up and upstream statistics.
 */

#include "src/gate/inc/HttpProbe.hpp"

#include "src/gate/inc/GateUtils.hpp"
#include "src/gate/inc/Process.hpp"

namespace quorum {
namespace gate {

namespace {

constexpr const char* AUTH_HEADER = "Authorization: Bearer sk-client";
constexpr const char* JSON_HEADER = "Content-Type: application/json";

/** @brief Outer bound on a curl run; curl enforces --max-time itself. */
std::chrono::milliseconds commandBudget(int maxTimeS) {
  return std::chrono::milliseconds(static_cast<long long>(maxTimeS) * 1000 + 2000);
}

} // namespace

/* ------------------------------ CurlClient ------------------------------ */

std::vector<std::string> CurlClient::postArgs(const std::string& url, const std::string& body,
                                              int connectTimeoutS, int maxTimeS) const {
  return {curlBin_,
          "-sS",
          "-o",
          "/dev/null",
          "-w",
          "%{http_code}",
          "--noproxy",
          "*",
          "--connect-timeout",
          std::to_string(connectTimeoutS),
          "--max-time",
          std::to_string(maxTimeS),
          "-X",
          "POST",
          url,
          "-H",
          AUTH_HEADER,
          "-H",
          JSON_HEADER,
          "--data",
          body};
}

std::optional<int> CurlClient::postJson(const std::string& url, const std::string& body,
                                        int connectTimeoutS, int maxTimeS) const {
  const CommandResult R =
      runCommand(postArgs(url, body, connectTimeoutS, maxTimeS), commandBudget(maxTimeS));
  if (R.timedOut) {
    return std::nullopt;
  }
  const auto CODE = parseInt(R.output);
  if (!CODE || *CODE <= 0) {
    return std::nullopt;
  }
  return static_cast<int>(*CODE);
}

std::optional<std::string> CurlClient::get(const std::string& url, bool http2PriorKnowledge,
                                           int maxTimeS) const {
  std::vector<std::string> args{curlBin_, "-sS", "--noproxy", "*"};
  if (http2PriorKnowledge) {
    args.emplace_back("--http2-prior-knowledge");
  }
  args.insert(args.end(), {"--max-time", std::to_string(maxTimeS), url});
  const CommandResult R = runCommand(args, commandBudget(maxTimeS));
  if (R.timedOut || R.exitCode != 0) {
    return std::nullopt;
  }
  return R.output;
}

/* --------------------------------- API --------------------------------- */

bool waitForHttpReady(const CurlClient& client, const std::string& url, const std::string& body,
                      std::chrono::milliseconds timeout) {
  const auto DEADLINE = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < DEADLINE) {
    const auto STATUS = client.postJson(url, body, 1, 1);
    if (STATUS && isReadyStatus(*STATUS)) {
      return true;
    }
    sleepInterruptible(std::chrono::milliseconds(50));
  }
  return false;
}

int sendWarmupRequests(const CurlClient& client, const std::string& url, const std::string& body,
                       int count, int connectTimeoutS, int maxTimeS) {
  int answered = 0;
  for (int i = 0; i < count; ++i) {
    throwIfInterrupted();
    if (client.postJson(url, body, connectTimeoutS, maxTimeS)) {
      ++answered;
    }
  }
  return answered;
}

} // namespace gate
} // namespace quorum
