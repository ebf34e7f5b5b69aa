#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace octant {

class TrackRun;

// Content shared by the text and HTML renderings of a run.
struct RunSummary_t {
  std::size_t trackCount = 0;
  std::size_t observationCount = 0;
  std::vector<std::string> columns;
  std::vector<std::string> sources;
  // (label, number of member tracks) in label order.
  std::vector<std::pair<std::string, std::size_t>> categories;
  bool inclusiveCategories = false;
  double timeStepH = 0.0;
  std::size_t settingsCount = 0;
};

RunSummary_t makeSummary(const TrackRun& run);
std::string toString(const RunSummary_t& summary, bool shortForm = false);
std::string toHtml(const RunSummary_t& summary);

} // namespace octant
