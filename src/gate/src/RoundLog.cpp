/**
 * @file RoundLog.cpp
 * @brief wrk summary scraping and the round-log line grammar.
 */

#include "src/gate/inc/RoundLog.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <map>

#include "src/gate/inc/GateError.hpp"
#include "src/gate/inc/GateUtils.hpp"

namespace quorum {
namespace gate {

namespace {

std::vector<std::string_view> splitFields(std::string_view line) {
  std::vector<std::string_view> out;
  std::size_t i = 0;
  while (i < line.size()) {
    while (i < line.size() && (line[i] == ' ' || line[i] == '\t')) {
      ++i;
    }
    const std::size_t START = i;
    while (i < line.size() && line[i] != ' ' && line[i] != '\t') {
      ++i;
    }
    if (i > START) {
      out.push_back(line.substr(START, i - START));
    }
  }
  return out;
}

/** @brief "<scenario> key=value ..." -> scenario plus key/value map; nullopt if any token is bare. */
std::optional<std::pair<std::string_view, std::map<std::string_view, std::string_view>>>
splitKeyValues(std::string_view line) {
  const auto FIELDS = splitFields(line);
  if (FIELDS.size() < 2) {
    return std::nullopt;
  }
  std::map<std::string_view, std::string_view> kv;
  for (std::size_t i = 1; i < FIELDS.size(); ++i) {
    const std::size_t EQ = FIELDS[i].find('=');
    if (EQ == std::string_view::npos || EQ == 0) {
      return std::nullopt;
    }
    kv[FIELDS[i].substr(0, EQ)] = FIELDS[i].substr(EQ + 1);
  }
  return std::make_pair(FIELDS[0], std::move(kv));
}

std::optional<std::string_view> lookup(const std::map<std::string_view, std::string_view>& kv,
                                       std::string_view key) {
  const auto IT = kv.find(key);
  if (IT == kv.end()) {
    return std::nullopt;
  }
  return IT->second;
}

} // namespace

/* ------------------------------ WrkSummary ------------------------------ */

WrkSummary parseWrkSummary(std::string_view output) {
  WrkSummary s;
  for (const std::string_view LINE : splitLines(output)) {
    const auto F = splitFields(LINE);
    if (F.empty()) {
      continue;
    }
    if (F[0] == "Requests/sec:" && F.size() >= 2) {
      s.requestsPerSecond = parseUnsignedDecimal(F[1]);
    } else if (F.size() >= 3 && F[1] == "requests" && F[2] == "in") {
      s.totalRequests = parseUnsignedInt(F[0]);
    } else if (F[0] == "99%" && F.size() >= 2) {
      s.p99 = std::string(F[1]);
    } else if (F[0] == "Latency" && F.size() >= 2 && !s.latencyAvg) {
      s.latencyAvg = std::string(F[1]);
    }
  }
  return s;
}

/* ---------------------------- Round-log lines ---------------------------- */

std::string formatLoadLine(const ScenarioId& scenario, const WrkSummary& summary) {
  std::array<char, 64> rps{};
  if (summary.requestsPerSecond) {
    std::snprintf(rps.data(), rps.size(), "%.2f", *summary.requestsPerSecond);
  } else {
    std::snprintf(rps.data(), rps.size(), "0");
  }
  return scenario + " wrk_requests=" + std::to_string(summary.totalRequests.value_or(0)) +
         " wrk_rps=" + rps.data() + " wrk_p99=" + summary.p99.value_or("n/a") +
         " wrk_latency_avg=" + summary.latencyAvg.value_or("n/a");
}

std::string formatResourceLine(const ScenarioId& scenario, double cpuPercent, long peakRssKb) {
  std::array<char, 96> buf{};
  std::snprintf(buf.data(), buf.size(), " cpu_pct=%.2f peak_rss_kb=%ld", cpuPercent, peakRssKb);
  return scenario + buf.data();
}

std::optional<LoadLine> parseLoadLine(std::string_view line) {
  const auto PARTS = splitKeyValues(line);
  if (!PARTS) {
    return std::nullopt;
  }
  const auto& kv = PARTS->second;
  const auto REQ = lookup(kv, "wrk_requests");
  const auto RPS = lookup(kv, "wrk_rps");
  const auto P99 = lookup(kv, "wrk_p99");
  const auto AVG = lookup(kv, "wrk_latency_avg");
  if (!REQ || !RPS || !P99 || !AVG) {
    return std::nullopt;
  }

  LoadLine out;
  out.scenario = std::string(PARTS->first);
  const auto REQUESTS = parseUnsignedInt(*REQ);
  const auto RATE = parseUnsignedDecimal(*RPS);
  const auto P99_US = parseLatencyUs(*P99);
  if (!REQUESTS || !RATE || !P99_US) {
    return std::nullopt;
  }
  out.requests = *REQUESTS;
  out.requestsPerSecond = *RATE;
  out.p99LatencyUs = *P99_US;
  if (*AVG != "n/a") {
    out.latencyAvgUs = parseLatencyUs(*AVG);
    if (!out.latencyAvgUs) {
      return std::nullopt;
    }
  }
  return out;
}

std::optional<ResourceLine> parseResourceLine(std::string_view line) {
  const auto PARTS = splitKeyValues(line);
  if (!PARTS) {
    return std::nullopt;
  }
  const auto CPU = lookup(PARTS->second, "cpu_pct");
  const auto RSS = lookup(PARTS->second, "peak_rss_kb");
  if (!CPU || !RSS) {
    return std::nullopt;
  }
  const auto CPU_VAL = parseUnsignedDecimal(*CPU);
  const auto RSS_VAL = parseUnsignedInt(*RSS);
  if (!CPU_VAL || !RSS_VAL) {
    return std::nullopt;
  }
  return ResourceLine{std::string(PARTS->first), *CPU_VAL, static_cast<long>(*RSS_VAL)};
}

RoundResult parseRoundLog(std::string_view text, const std::vector<ScenarioId>& scenarios) {
  std::map<ScenarioId, LoadLine> loads;
  std::map<ScenarioId, ResourceLine> resources;

  for (const std::string_view LINE : splitLines(text)) {
    const auto FIELDS = splitFields(LINE);
    if (FIELDS.size() < 2) {
      continue;
    }
    const ScenarioId NAME(FIELDS[0]);
    if (std::find(scenarios.begin(), scenarios.end(), NAME) == scenarios.end()) {
      continue;
    }
    if (LINE.find("wrk_rps=") != std::string_view::npos) {
      auto load = parseLoadLine(LINE);
      if (!load) {
        throw GateError(ErrorKind::Round,
                        "unparseable load metrics for " + NAME + ": " + std::string(LINE));
      }
      loads[NAME] = std::move(*load);
    } else if (LINE.find("cpu_pct=") != std::string_view::npos) {
      auto res = parseResourceLine(LINE);
      if (!res) {
        throw GateError(ErrorKind::Round,
                        "unparseable resource metrics for " + NAME + ": " + std::string(LINE));
      }
      resources[NAME] = std::move(*res);
    }
  }

  RoundResult round;
  for (const auto& name : scenarios) {
    const auto LOAD = loads.find(name);
    if (LOAD == loads.end()) {
      throw GateError(ErrorKind::Round, "missing load metrics for scenario: " + name);
    }
    const auto RES = resources.find(name);
    if (RES == resources.end()) {
      throw GateError(ErrorKind::Round, "missing resource metrics for scenario: " + name);
    }
    round[name] = RoundMetrics{LOAD->second.requestsPerSecond, LOAD->second.p99LatencyUs,
                               RES->second.cpuPercent,
                               static_cast<double>(RES->second.peakRssKb)};
  }
  return round;
}

/* ---------------------------- Upstream stats ---------------------------- */

namespace {

std::optional<long long> jsonIntegerField(std::string_view json, std::string_view key) {
  const std::string NEEDLE = "\"" + std::string(key) + "\"";
  const std::size_t AT = json.find(NEEDLE);
  if (AT == std::string_view::npos) {
    return std::nullopt;
  }
  std::size_t i = AT + NEEDLE.size();
  while (i < json.size() && (json[i] == ' ' || json[i] == '\t' || json[i] == '\n')) {
    ++i;
  }
  if (i >= json.size() || json[i] != ':') {
    return std::nullopt;
  }
  ++i;
  while (i < json.size() && (json[i] == ' ' || json[i] == '\t' || json[i] == '\n')) {
    ++i;
  }
  const std::size_t START = i;
  while (i < json.size() && json[i] >= '0' && json[i] <= '9') {
    ++i;
  }
  if (i == START) {
    return std::nullopt;
  }
  return parseInt(json.substr(START, i - START));
}

} // namespace

std::optional<UpstreamStats> parseUpstreamStats(std::string_view json) {
  const auto H1 = jsonIntegerField(json, "h1");
  const auto H2 = jsonIntegerField(json, "h2");
  if (!H1 || !H2) {
    return std::nullopt;
  }
  return UpstreamStats{*H1, *H2};
}

} // namespace gate
} // namespace quorum
