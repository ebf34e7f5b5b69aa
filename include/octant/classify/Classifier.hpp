#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "octant/classify/Rule.hpp"
#include "octant/track/TrackRun.hpp"

namespace octant {

// Called after each track with (tracks done, tracks total).
using ProgressCallback = std::function<void(std::size_t, std::size_t)>;

struct ClassifyOptions_t {
  // Each rule refines the previous one; labels become "label|prev|...|first".
  bool inclusive = false;
  // Drop every existing category before writing the new ones.
  bool clear = false;
  ProgressCallback progress;
  // Debug log cadence in tracks; 0 disables it.
  std::size_t logEvery = 500;
};

// Category from a percentile threshold of a per-track metric.
struct PercentileRule_t {
  // Scalar track property, e.g. "max_vort". Ignored when metric is set.
  std::string property;
  // Custom metric with its label.
  std::function<double(const Track&)> metric;
  std::string metricLabel;
  // Only tracks of this category take part in the percentile.
  std::optional<std::string> subset;
  double percentile = 95.0;
  Comparison_e op = Comparison_e::kGe;
};

// Evaluates rules against every track of a run and writes one membership
// column per rule. A failing predicate aborts the call without touching the
// run's categories.
class Classifier {
public:
  explicit Classifier(ClassifyOptions_t options);

  void classify(TrackRun& run, const std::vector<Rule_t>& rules) const;
  void classifyByPercentile(TrackRun& run, const PercentileRule_t& rule) const;

  // Column names written for the rules under the given mode.
  static std::vector<std::string> effectiveLabels(const std::vector<Rule_t>& rules, bool inclusive);
  // Label of a percentile category, e.g. "max_vort__ge__95pc|pmc".
  static std::string percentileLabel(const PercentileRule_t& rule);
  // Linear interpolation between closest ranks; NaN values are ignored.
  static double percentile(std::vector<double> values, double perc);

private:
  void validate(const TrackRun& run, const std::vector<Rule_t>& rules) const;

  ClassifyOptions_t options;
};

} // namespace octant
