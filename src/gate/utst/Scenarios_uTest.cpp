/**
 * @file Scenarios_uTest.cpp
 * @brief Unit tests for the scenario catalogue, request payloads and subject config rendering.
 */

#include "src/gate/inc/Scenarios.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using quorum::gate::defaultScenarios;
using quorum::gate::GateConfig;
using quorum::gate::renderSubjectConfig;
using quorum::gate::requestPayload;
using quorum::gate::ScenarioId;
using quorum::gate::scenarioIds;
using quorum::gate::ScenarioSpec;
using quorum::gate::upstreamEnvironment;
using quorum::gate::UpstreamTopology;

namespace {

bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

ScenarioSpec byId(const std::vector<ScenarioSpec>& specs, const std::string& id) {
  for (const auto& s : specs) {
    if (s.id == id) {
      return s;
    }
  }
  ADD_FAILURE() << "no scenario " << id;
  return {};
}

} // namespace

/* ----------------------------- Catalogue ----------------------------- */

/** @test Four base scenarios in fixed order; alias remap appends two more. */
TEST(ScenariosTest, CatalogueOrder) {
  const std::vector<ScenarioId> BASE = {"forward_nonstream_wrk", "forward_stream_wrk",
                                        "fc_inject_nonstream_wrk", "fc_inject_stream_wrk"};
  EXPECT_EQ(scenarioIds(defaultScenarios(false)), BASE);

  const auto WITH_ALIAS = scenarioIds(defaultScenarios(true));
  ASSERT_EQ(WITH_ALIAS.size(), 6u);
  EXPECT_EQ(WITH_ALIAS[4], "alias_remap_nonstream_wrk");
  EXPECT_EQ(WITH_ALIAS[5], "alias_remap_stream_wrk");
  EXPECT_EQ(byId(defaultScenarios(true), "alias_remap_stream_wrk").topology,
            UpstreamTopology::AliasGroup);
}

/* ----------------------------- Payloads ----------------------------- */

/** @test Stream flag and tool injection shape the request body. */
TEST(ScenariosTest, RequestPayloads) {
  const auto SPECS = defaultScenarios(true);
  const std::string PLAIN = requestPayload(byId(SPECS, "forward_nonstream_wrk"));
  EXPECT_EQ(PLAIN, R"({"model":"m1","messages":[{"role":"user","content":"hi"}]})");

  const std::string STREAM = requestPayload(byId(SPECS, "forward_stream_wrk"));
  EXPECT_TRUE(contains(STREAM, R"("stream":true)"));
  EXPECT_FALSE(contains(STREAM, "tools"));

  const std::string FC = requestPayload(byId(SPECS, "fc_inject_stream_wrk"));
  EXPECT_TRUE(contains(FC, R"("tools":[)"));
  EXPECT_TRUE(contains(FC, "get_weather"));
  EXPECT_TRUE(contains(FC, R"("stream":true)"));

  EXPECT_TRUE(contains(requestPayload(byId(SPECS, "alias_remap_nonstream_wrk")),
                       R"("model":"smart")"));
}

/* ----------------------------- Subject config ----------------------------- */

/** @test Ports, transport and worker threads flow into the generated config. */
TEST(ScenariosTest, SubjectConfigSingleUpstream) {
  GateConfig cfg;
  cfg.proxyPort = 28080;
  cfg.upstreamPort = 29001;
  cfg.workerThreads = 2;
  const std::string YAML = renderSubjectConfig(byId(defaultScenarios(false), "forward_stream_wrk"), cfg);
  EXPECT_TRUE(contains(YAML, "  port: 28080\n"));
  EXPECT_TRUE(contains(YAML, "http_force_h2c_upstream: true\n"));
  EXPECT_TRUE(contains(YAML, "runtime_worker_threads: 2\n"));
  EXPECT_TRUE(contains(YAML, "base_url: \"http://127.0.0.1:29001/v1\""));
  EXPECT_TRUE(contains(YAML, "name: \"mock-openai\""));
  EXPECT_FALSE(contains(YAML, "mock-openai-b"));
  EXPECT_TRUE(contains(YAML, "log_level: \"DISABLED\""));
}

/** @test The alias topology declares two upstream services behind one alias. */
TEST(ScenariosTest, SubjectConfigAliasGroup) {
  GateConfig cfg;
  cfg.upstreamTransport = "auto";
  const std::string YAML =
      renderSubjectConfig(byId(defaultScenarios(true), "alias_remap_nonstream_wrk"), cfg);
  EXPECT_TRUE(contains(YAML, "http_force_h2c_upstream: false\n"));
  EXPECT_TRUE(contains(YAML, "\"smart:m1\""));
  EXPECT_TRUE(contains(YAML, "\"smart:m2\""));
  EXPECT_TRUE(contains(YAML, "name: \"mock-openai-a\"\n    provider: \"openai\""));
}

/** @test Upstream simulator environment mirrors scenario and config. */
TEST(ScenariosTest, UpstreamEnvironment) {
  GateConfig cfg;
  cfg.mockScenario = "code";
  const auto ENV = upstreamEnvironment(byId(defaultScenarios(false), "forward_stream_wrk"), cfg);
  const std::vector<std::pair<std::string, std::string>> EXPECTED = {
      {"MOCK_MODE", "stream"},
      {"MOCK_TRANSPORT", "h2c"},
      {"MOCK_SCENARIO", "code"},
      {"UPSTREAM_PORT", "19001"}};
  EXPECT_EQ(ENV, EXPECTED);
}
