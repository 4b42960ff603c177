#ifndef QUORUM_HTTPPROBE_HPP
#define QUORUM_HTTPPROBE_HPP
/**
 * @file HttpProbe.hpp
 * @brief Canary, warm-up and statistics requests issued through the curl command-line tool.
 *
 * @note NOT RT-safe (spawns subprocesses).
 */

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace quorum {
namespace gate {

/* ------------------------------ CurlClient ------------------------------ */

/**
 * @brief Thin wrapper over the curl binary. Proxies are always bypassed.
 */
class CurlClient {
public:
  explicit CurlClient(std::string curlBin = "curl") : curlBin_(std::move(curlBin)) {}

  /**
   * @brief POST an authenticated JSON body.
   * @return HTTP status code, or nullopt when no response arrived (curl prints 000).
   */
  std::optional<int> postJson(const std::string& url, const std::string& body,
                              int connectTimeoutS, int maxTimeS) const;

  /**
   * @brief GET a body.
   * @param http2PriorKnowledge Speak cleartext HTTP/2 without upgrade.
   * @return Body, or nullopt if curl failed.
   */
  std::optional<std::string> get(const std::string& url, bool http2PriorKnowledge,
                                 int maxTimeS) const;

  /** @brief Arguments for a POST (exposed for diagnostics and tests). */
  std::vector<std::string> postArgs(const std::string& url, const std::string& body,
                                    int connectTimeoutS, int maxTimeS) const;

private:
  std::string curlBin_;
};

/* --------------------------------- API --------------------------------- */

/** @brief Ready iff the canary answered 200 or any 4xx. */
inline bool isReadyStatus(int status) noexcept {
  return status == 200 || (status >= 400 && status <= 499);
}

/**
 * @brief Repeat a 1 s canary POST until a ready status or @p timeout.
 * @return false on timeout.
 */
bool waitForHttpReady(const CurlClient& client, const std::string& url, const std::string& body,
                      std::chrono::milliseconds timeout);

/**
 * @brief Issue @p count discarded requests.
 * @return Number of requests that received any HTTP response.
 */
int sendWarmupRequests(const CurlClient& client, const std::string& url, const std::string& body,
                       int count, int connectTimeoutS, int maxTimeS);

} // namespace gate
} // namespace quorum

#endif // QUORUM_HTTPPROBE_HPP
