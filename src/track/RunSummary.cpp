#include "octant/track/RunSummary.hpp"

#include <fmt/core.h>
#include <fmt/format.h>

#include "octant/track/TrackRun.hpp"

namespace octant {

namespace {

std::string escapeHtml(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    switch (c) {
      case '&':
        out += "&amp;";
        break;
      case '<':
        out += "&lt;";
        break;
      case '>':
        out += "&gt;";
        break;
      case '"':
        out += "&quot;";
        break;
      default:
        out += c;
    }
  }
  return out;
}

std::string categoryList(const RunSummary_t& summary) {
  if (summary.categories.empty()) {
    return "none";
  }
  std::vector<std::string> parts;
  for (const auto& category : summary.categories) {
    parts.push_back(fmt::format("{} ({})", category.first, category.second));
  }
  return fmt::format("{}", fmt::join(parts, ", "));
}

} // namespace

RunSummary_t makeSummary(const TrackRun& run) {
  RunSummary_t summary;
  summary.trackCount = run.size();
  summary.observationCount = run.data().numberOfRows();
  summary.columns = run.columns();
  summary.sources = run.sources();
  for (const std::string& label : run.catLabels()) {
    summary.categories.emplace_back(label, run.size(label));
  }
  summary.inclusiveCategories = run.isCatInclusive();
  summary.timeStepH = run.timeStepH();
  summary.settingsCount = run.settings().size();
  return summary;
}

std::string toString(const RunSummary_t& summary, bool shortForm) {
  if (shortForm) {
    return fmt::format("TrackRun({} tracks; columns: {}; sources: {})",
                       summary.trackCount,
                       summary.columns.empty() ? "none" : fmt::format("{}", fmt::join(summary.columns, ", ")),
                       summary.sources.empty() ? "none" : fmt::format("{}", fmt::join(summary.sources, ", ")));
  }
  std::string out = "Cyclone tracking results\n";
  out += fmt::format("  Number of tracks: {}\n", summary.trackCount);
  out += fmt::format("  Number of observations: {}\n", summary.observationCount);
  out += fmt::format("  Columns: {}\n", summary.columns.empty() ? "none" : fmt::format("{}", fmt::join(summary.columns, ", ")));
  out += fmt::format("  Time step: {} h\n", summary.timeStepH);
  out += fmt::format("  Categories{}: {}\n", summary.inclusiveCategories ? " (inclusive)" : "", categoryList(summary));
  out += fmt::format("  Tracking settings: {} entries\n", summary.settingsCount);
  out += "  Sources:";
  if (summary.sources.empty()) {
    out += " none\n";
  } else {
    out += "\n";
    for (const std::string& source : summary.sources) {
      out += fmt::format("    {}\n", source);
    }
  }
  return out;
}

std::string toHtml(const RunSummary_t& summary) {
  std::string out = "<table>\n<caption>Cyclone tracking results</caption>\n";
  const auto row = [&out](const std::string& key, const std::string& value) {
    out += fmt::format("<tr><th>{}</th><td>{}</td></tr>\n", key, escapeHtml(value));
  };
  row("Number of tracks", std::to_string(summary.trackCount));
  row("Number of observations", std::to_string(summary.observationCount));
  row("Columns", fmt::format("{}", fmt::join(summary.columns, ", ")));
  row("Time step (h)", fmt::format("{}", summary.timeStepH));
  row(summary.inclusiveCategories ? "Categories (inclusive)" : "Categories", categoryList(summary));
  row("Tracking settings", std::to_string(summary.settingsCount));
  row("Sources", fmt::format("{}", fmt::join(summary.sources, ", ")));
  out += "</table>\n";
  return out;
}

} // namespace octant
