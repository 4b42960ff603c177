/**
 * @file Scenarios.cpp
 * @brief Scenario catalogue and subject configuration rendering.
 */

#include "src/gate/inc/Scenarios.hpp"

#include <sstream>

namespace quorum {
namespace gate {

namespace {

constexpr const char* TOOLS_JSON =
    R"("tools":[{"type":"function","function":{"name":"get_weather",)"
    R"("description":"Get the current weather for a city",)"
    R"("parameters":{"type":"object","properties":{"city":{"type":"string"}},)"
    R"("required":["city"]}}}])";

void appendService(std::ostringstream& os, const std::string& name, const std::string& model,
                   bool isDefault, int upstreamPort) {
  os << "  - name: \"" << name << "\"\n"
     << "    provider: \"openai\"\n"
     << "    base_url: \"http://127.0.0.1:" << upstreamPort << "/v1\"\n"
     << "    api_key: \"sk-upstream\"\n"
     << "    models:\n"
     << "      - \"" << model << "\"\n"
     << "    is_default: " << (isDefault ? "true" : "false") << "\n";
}

} // namespace

std::vector<ScenarioSpec> defaultScenarios(bool includeAliasRemap) {
  std::vector<ScenarioSpec> out{
      {"forward_nonstream_wrk", false, false, "m1", UpstreamTopology::Single},
      {"forward_stream_wrk", true, false, "m1", UpstreamTopology::Single},
      {"fc_inject_nonstream_wrk", false, true, "m1", UpstreamTopology::Single},
      {"fc_inject_stream_wrk", true, true, "m1", UpstreamTopology::Single},
  };
  if (includeAliasRemap) {
    out.push_back({"alias_remap_nonstream_wrk", false, false, "smart", UpstreamTopology::AliasGroup});
    out.push_back({"alias_remap_stream_wrk", true, false, "smart", UpstreamTopology::AliasGroup});
  }
  return out;
}

std::vector<ScenarioId> scenarioIds(const std::vector<ScenarioSpec>& specs) {
  std::vector<ScenarioId> ids;
  ids.reserve(specs.size());
  for (const auto& s : specs) {
    ids.push_back(s.id);
  }
  return ids;
}

std::string requestPayload(const ScenarioSpec& spec) {
  std::string body = R"({"model":")" + spec.model +
                     R"(","messages":[{"role":"user","content":"hi"}])";
  if (spec.injectTools) {
    body += ",";
    body += TOOLS_JSON;
  }
  if (spec.stream) {
    body += R"(,"stream":true)";
  }
  body += "}";
  return body;
}

std::string renderSubjectConfig(const ScenarioSpec& spec, const GateConfig& cfg) {
  std::ostringstream os;
  os << "server:\n"
     << "  port: " << cfg.proxyPort << "\n"
     << "  host: \"127.0.0.1\"\n"
     << "  timeout: 30\n"
     << "  http_use_env_proxy: false\n"
     << "  http_force_h2c_upstream: " << (cfg.upstreamTransport == "h2c" ? "true" : "false")
     << "\n"
     << "  runtime_worker_threads: " << cfg.workerThreads << "\n"
     << "  runtime_max_blocking_threads: 8\n"
     << "  runtime_thread_stack_size_kb: 512\n"
     << "upstream_services:\n";
  if (spec.topology == UpstreamTopology::AliasGroup) {
    appendService(os, "mock-openai-a", "smart:m1", true, cfg.upstreamPort);
    appendService(os, "mock-openai-b", "smart:m2", false, cfg.upstreamPort);
  } else {
    appendService(os, "mock-openai", "m1", true, cfg.upstreamPort);
  }
  os << "client_authentication:\n"
     << "  allowed_keys:\n"
     << "    - \"sk-client\"\n"
     << "features:\n"
     << "  enable_function_calling: true\n"
     << "  log_level: \"DISABLED\"\n"
     << "  convert_developer_to_system: true\n"
     << "  enable_fc_error_retry: false\n"
     << "  fc_error_retry_max_attempts: 3\n";
  return os.str();
}

std::vector<std::pair<std::string, std::string>> upstreamEnvironment(const ScenarioSpec& spec,
                                                                     const GateConfig& cfg) {
  return {{"MOCK_MODE", spec.stream ? "stream" : "nonstream"},
          {"MOCK_TRANSPORT", cfg.upstreamTransport},
          {"MOCK_SCENARIO", cfg.mockScenario},
          {"UPSTREAM_PORT", std::to_string(cfg.upstreamPort)}};
}

} // namespace gate
} // namespace quorum
