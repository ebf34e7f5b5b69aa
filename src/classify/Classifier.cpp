#include "octant/classify/Classifier.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <set>

#include <fmt/core.h>
#include <fmt/format.h>

#include "octant/core/Errors.hpp"
#include "octant/core/Logger.hpp"

namespace octant {

Classifier::Classifier(ClassifyOptions_t options) : options(std::move(options)) {}

std::vector<std::string> Classifier::effectiveLabels(const std::vector<Rule_t>& rules, bool inclusive) {
  std::vector<std::string> labels;
  labels.reserve(rules.size());
  for (std::size_t i = 0; i < rules.size(); ++i) {
    if (!inclusive || i == 0) {
      labels.push_back(rules[i].label);
      continue;
    }
    std::string label = rules[i].label;
    for (std::size_t j = i; j-- > 0;) {
      label += TrackRun::kCategorySeparator;
      label += rules[j].label;
    }
    labels.push_back(label);
  }
  return labels;
}

void Classifier::validate(const TrackRun& run, const std::vector<Rule_t>& rules) const {
  std::set<std::string> seen;
  for (const Rule_t& rule : rules) {
    if (rule.label.empty()) {
      throw ArgumentError("Category labels must not be empty");
    }
    if (rule.label == TrackRun::kAllLabel) {
      throw ArgumentError("'all' is not a permitted label");
    }
    if (!seen.insert(rule.label).second) {
      throw ArgumentError(fmt::format("Category '{}' is defined twice", rule.label));
    }
    for (const Predicate_t& predicate : rule.predicates) {
      if (!predicate.test) {
        throw ArgumentError(fmt::format("Category '{}': predicate '{}' is empty", rule.label, predicate.name));
      }
    }
    if (run.empty()) {
      continue;
    }
    for (const std::string& column : rule.requiredColumns) {
      if (!run.data().hasColumn(column)) {
        throw SchemaMismatchError(fmt::format("Category '{}' needs column '{}', run has [{}]",
                                              rule.label, column, fmt::join(run.columns(), ", ")));
      }
    }
  }
}

void Classifier::classify(TrackRun& run, const std::vector<Rule_t>& rules) const {
  validate(run, rules);
  const std::vector<std::string> labels = effectiveLabels(rules, options.inclusive);
  const std::size_t total = run.size();
  auto logger = Logger::GetClass("Classifier");
  if (logger) {
    logger->info("Classifying {} tracks into [{}]{}", total, fmt::join(labels, ", "),
                 options.inclusive ? " (inclusive)" : "");
  }

  std::vector<std::vector<bool>> flags(rules.size(), std::vector<bool>(total, false));
  std::size_t done = 0;
  for (const auto& entry : run.groups()) {
    const int trackId = entry.first;
    const Track& track = entry.second;
    bool previous = true;
    for (std::size_t r = 0; r < rules.size(); ++r) {
      bool member = options.inclusive ? previous : true;
      for (const Predicate_t& predicate : rules[r].predicates) {
        bool result = false;
        try {
          result = predicate.test(track);
        } catch (const std::exception& ex) {
          std::throw_with_nested(ClassificationError(labels[r], trackId, ex.what()));
        } catch (...) {
          std::throw_with_nested(ClassificationError(labels[r], trackId, "non-standard exception"));
        }
        // Every predicate runs so that a broken one is reported even when an
        // earlier one already ruled the track out.
        member = member && result;
      }
      flags[r][done] = member;
      previous = member;
    }
    ++done;
    if (options.progress) {
      options.progress(done, total);
    }
    if (logger && options.logEvery > 0 && done % options.logEvery == 0) {
      logger->debug("Classified {}/{} tracks", done, total);
    }
  }

  CategoryTable updated = run.categoryTable();
  if (options.clear) {
    updated.clear();
  }
  for (std::size_t r = 0; r < rules.size(); ++r) {
    updated.set(labels[r], std::move(flags[r]));
  }
  run.writeCategories(std::move(updated), options.inclusive);

  if (logger) {
    for (const std::string& label : labels) {
      logger->info("Category '{}': {} of {} tracks", label, run.size(label), total);
    }
  }
}

std::string Classifier::percentileLabel(const PercentileRule_t& rule) {
  const std::string metric = rule.metric ? rule.metricLabel : rule.property;
  std::string label = fmt::format("{}__{}__{}pc", metric, toString(rule.op), rule.percentile);
  if (rule.subset) {
    label += TrackRun::kCategorySeparator + *rule.subset;
  }
  return label;
}

double Classifier::percentile(std::vector<double> values, double perc) {
  values.erase(std::remove_if(values.begin(), values.end(), [](double v) { return std::isnan(v); }), values.end());
  if (values.empty()) {
    throw ArgumentError("percentile of an empty sequence");
  }
  if (perc < 0.0 || perc > 100.0) {
    throw ArgumentError(fmt::format("Percentile {} is outside [0, 100]", perc));
  }
  std::sort(values.begin(), values.end());
  const double rank = perc / 100.0 * static_cast<double>(values.size() - 1);
  const auto lower = static_cast<std::size_t>(std::floor(rank));
  const std::size_t upper = std::min(lower + 1, values.size() - 1);
  const double weight = rank - static_cast<double>(lower);
  return values[lower] + weight * (values[upper] - values[lower]);
}

void Classifier::classifyByPercentile(TrackRun& run, const PercentileRule_t& rule) const {
  if (rule.percentile < 0.0 || rule.percentile > 100.0) {
    throw ArgumentError(fmt::format("Percentile {} is outside [0, 100]", rule.percentile));
  }
  if (rule.metric && rule.metricLabel.empty()) {
    throw ArgumentError("A custom percentile metric needs a label");
  }
  if (!rule.metric) {
    const auto& names = Track::scalarPropertyNames();
    if (std::find(names.begin(), names.end(), rule.property) == names.end()) {
      throw ArgumentError(fmt::format("Unknown track property '{}'", rule.property));
    }
  }
  const std::string label = percentileLabel(rule);
  const TrackRunView view = rule.subset ? run.select(*rule.subset) : run.all();
  if (view.empty()) {
    if (auto logger = Logger::GetClass("Classifier")) {
      logger->warn("Percentile category '{}' skipped: no tracks to rank", label);
    }
    return;
  }

  std::vector<double> values;
  values.reserve(view.size());
  for (const auto& entry : view.groups()) {
    try {
      values.push_back(rule.metric ? rule.metric(entry.second) : entry.second.scalarProperty(rule.property));
    } catch (const std::exception& ex) {
      std::throw_with_nested(ClassificationError(label, entry.first, ex.what()));
    }
  }
  if (std::all_of(values.begin(), values.end(), [](double v) { return std::isnan(v); })) {
    if (auto logger = Logger::GetClass("Classifier")) {
      logger->warn("Percentile category '{}' skipped: no track has a defined value", label);
    }
    return;
  }
  const double threshold = percentile(values, rule.percentile);

  std::vector<bool> flags(run.size(), false);
  const std::vector<std::size_t>& positions = view.trackPositions();
  for (std::size_t i = 0; i < positions.size(); ++i) {
    flags[positions[i]] = compare(values[i], rule.op, threshold);
  }
  CategoryTable updated = run.categoryTable();
  updated.set(label, std::move(flags));
  run.writeCategories(std::move(updated), run.isCatInclusive());

  if (auto logger = Logger::GetClass("Classifier")) {
    logger->info("Category '{}' (threshold {:.6g}): {} of {} tracks", label, threshold, run.size(label), run.size());
  }
}

} // namespace octant
