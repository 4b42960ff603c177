/**
 * @file BaselineStore.cpp
 * @brief Baseline snapshot parser and writer.
 */

#include "src/gate/inc/BaselineStore.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>

#include "src/gate/inc/GateError.hpp"
#include "src/gate/inc/GateUtils.hpp"

namespace quorum {
namespace gate {

namespace {

constexpr std::string_view RESULTS_HEADER = "## Results";
constexpr std::string_view SECTION_PREFIX = "## ";

bool startsWith(std::string_view s, std::string_view prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

std::vector<std::string_view> splitCells(std::string_view line) {
  std::vector<std::string_view> cells;
  std::size_t start = 0;
  while (true) {
    const std::size_t END = line.find('|', start);
    if (END == std::string_view::npos) {
      cells.push_back(line.substr(start));
      break;
    }
    cells.push_back(line.substr(start, END - start));
    start = END + 1;
  }
  return cells;
}

/** Row shape: "| `name` | ..." with cells 1..6 present. */
std::optional<BaselineRow> parseRow(std::string_view line) {
  if (!startsWith(line, "| `")) {
    return std::nullopt;
  }
  const auto CELLS = splitCells(line);
  if (CELLS.size() < 7) {
    return std::nullopt;
  }

  const std::string_view NAME_CELL = trim(CELLS[1]);
  if (NAME_CELL.size() < 3 || NAME_CELL.front() != '`' || NAME_CELL.back() != '`') {
    return std::nullopt;
  }

  BaselineRow row;
  row.source = std::string(line);
  row.scenario = std::string(trim(stripChars(NAME_CELL, "`")));
  row.rps = std::string(trim(CELLS[2]));
  row.p99 = std::string(trim(CELLS[3]));
  row.avgLatency = std::string(trim(CELLS[4]));
  row.cpu = std::string(trim(CELLS[5]));
  row.rss = std::string(trim(CELLS[6]));
  if (CELLS.size() > 7) {
    row.notes = std::string(trim(CELLS[7]));
  }

  // Guard against unrelated tables that happen to sit inside the section.
  if (row.cpu.find('%') == std::string::npos || row.rss.find("KB") == std::string::npos) {
    return std::nullopt;
  }
  if (row.scenario.empty()) {
    return std::nullopt;
  }
  return row;
}

bool sameCells(const BaselineRow& a, const BaselineRow& b) {
  return a.scenario == b.scenario && a.rps == b.rps && a.p99 == b.p99 &&
         a.avgLatency == b.avgLatency && a.cpu == b.cpu && a.rss == b.rss && a.notes == b.notes;
}

std::string renderRow(const BaselineRow& r) {
  if (!r.source.empty()) {
    const auto ORIGINAL = parseRow(r.source);
    if (ORIGINAL && sameCells(*ORIGINAL, r)) {
      return r.source;
    }
  }
  return "| `" + r.scenario + "` | " + r.rps + " | " + r.p99 + " | " + r.avgLatency + " | " +
         r.cpu + " | " + r.rss + " | " + r.notes + " |";
}

} // namespace

/* ----------------------------- Document I/O ----------------------------- */

BaselineDocument parseBaselineDocument(std::string_view text) {
  BaselineDocument doc;
  doc.tableHead.clear();
  doc.hasResults = false;
  doc.finalNewline = text.empty() || text.back() == '\n';

  bool inResults = false;
  std::vector<std::string> pending;
  for (const std::string_view LINE : splitLines(text)) {
    if (!doc.hasResults) {
      if (LINE == RESULTS_HEADER) {
        doc.hasResults = true;
        inResults = true;
      } else {
        doc.preamble.emplace_back(LINE);
      }
      continue;
    }

    if (startsWith(LINE, SECTION_PREFIX)) {
      inResults = (LINE == RESULTS_HEADER);
    } else if (inResults) {
      if (auto row = parseRow(LINE)) {
        if (doc.rows.empty()) {
          doc.tableHead = std::move(pending);
        } else {
          row->leading = std::move(pending);
        }
        pending.clear();
        doc.rows.push_back(std::move(*row));
        continue;
      }
    }
    pending.emplace_back(LINE);
  }

  if (doc.rows.empty()) {
    doc.tableHead = std::move(pending);
  } else {
    doc.trailer = std::move(pending);
  }
  return doc;
}

std::string renderBaselineDocument(const BaselineDocument& doc) {
  std::string out;
  const auto EMIT = [&out](std::string_view line) {
    out += line;
    out += '\n';
  };

  for (const auto& line : doc.preamble) {
    EMIT(line);
  }
  if (doc.hasResults || !doc.rows.empty()) {
    EMIT(RESULTS_HEADER);
    for (const auto& line : doc.tableHead) {
      EMIT(line);
    }
    for (const auto& r : doc.rows) {
      for (const auto& line : r.leading) {
        EMIT(line);
      }
      EMIT(renderRow(r));
    }
    for (const auto& line : doc.trailer) {
      EMIT(line);
    }
  }

  if (!doc.finalNewline && !out.empty()) {
    out.pop_back();
  }
  return out;
}

void writeBaselineDocument(const std::string& path, const BaselineDocument& doc) {
  const std::filesystem::path P(path);
  std::error_code ec;
  if (P.has_parent_path()) {
    std::filesystem::create_directories(P.parent_path(), ec);
  }
  if (!writeFile(P, renderBaselineDocument(doc))) {
    throw GateError(ErrorKind::Setup, "failed to write baseline file: " + path);
  }
}

/* ----------------------------- Entries ----------------------------- */

std::optional<BaselineEntry> toBaselineEntry(const BaselineRow& row) {
  const auto RPS = parseUnsignedDecimal(stripChars(row.rps, " ,"));
  const auto P99_US = parseLatencyUs(row.p99);
  const auto CPU = parseUnsignedDecimal(stripChars(row.cpu, " ,%"));

  std::string rss = stripChars(row.rss, " ,");
  if (rss.size() >= 2 && rss.compare(rss.size() - 2, 2, "KB") == 0) {
    rss.resize(rss.size() - 2);
  }
  const auto RSS = parseUnsignedDecimal(rss);

  if (!RPS || !P99_US || !CPU || !RSS) {
    return std::nullopt;
  }
  return makeBaselineEntry(*RPS, *P99_US, *CPU, *RSS);
}

Baseline parseBaseline(std::string_view text, const std::vector<ScenarioId>& scenarios) {
  const BaselineDocument DOC = parseBaselineDocument(text);

  Baseline baseline;
  for (const auto& row : DOC.rows) {
    const bool WANTED =
        std::find(scenarios.begin(), scenarios.end(), row.scenario) != scenarios.end();
    if (!WANTED) {
      continue;
    }
    const auto ENTRY = toBaselineEntry(row);
    if (!ENTRY) {
      throw GateError(ErrorKind::Setup, "failed to parse baseline row for " + row.scenario +
                                            ": rps=" + row.rps + " p99=" + row.p99 +
                                            " cpu=" + row.cpu + " rss=" + row.rss);
    }
    baseline[row.scenario] = *ENTRY;
  }

  for (const auto& scenario : scenarios) {
    if (baseline.find(scenario) == baseline.end()) {
      throw GateError(ErrorKind::Setup, "baseline missing scenario: " + scenario);
    }
  }
  return baseline;
}

Baseline loadBaseline(const std::string& path, const std::vector<ScenarioId>& scenarios) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    throw GateError(ErrorKind::Setup, "baseline file not found: " + path);
  }
  return parseBaseline(slurp(path), scenarios);
}

BaselineRow makeBaselineRow(const ScenarioId& scenario, double rps, double p99Us, double cpuPercent,
                            double rssKb, int rounds) {
  char buf[64];
  BaselineRow row;
  row.scenario = scenario;

  std::snprintf(buf, sizeof(buf), "%.2f", rps);
  row.rps = buf;
  std::snprintf(buf, sizeof(buf), "%.2fms", p99Us / 1000.0);
  row.p99 = buf;
  row.avgLatency = "n/a";
  std::snprintf(buf, sizeof(buf), "%.2f%%", cpuPercent);
  row.cpu = buf;
  std::snprintf(buf, sizeof(buf), "%.0fKB", rssKb);
  row.rss = buf;
  row.notes = "median of " + std::to_string(rounds) + " rounds";
  return row;
}

} // namespace gate
} // namespace quorum
