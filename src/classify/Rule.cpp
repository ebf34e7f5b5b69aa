#include "octant/classify/Rule.hpp"

#include <algorithm>

#include <fmt/core.h>

#include "octant/core/Errors.hpp"

namespace octant {

Comparison_e parseComparison(const std::string& value) {
  if (value == "lt") {
    return Comparison_e::kLt;
  }
  if (value == "le") {
    return Comparison_e::kLe;
  }
  if (value == "gt") {
    return Comparison_e::kGt;
  }
  if (value == "ge") {
    return Comparison_e::kGe;
  }
  if (value == "eq") {
    return Comparison_e::kEq;
  }
  if (value == "ne") {
    return Comparison_e::kNe;
  }
  throw ArgumentError(fmt::format("op={} should be one of lt, le, gt, ge, eq, ne", value));
}

std::string toString(Comparison_e op) {
  switch (op) {
    case Comparison_e::kLt:
      return "lt";
    case Comparison_e::kLe:
      return "le";
    case Comparison_e::kGt:
      return "gt";
    case Comparison_e::kGe:
      return "ge";
    case Comparison_e::kEq:
      return "eq";
    case Comparison_e::kNe:
      return "ne";
  }
  return "ge";
}

bool compare(double lhs, Comparison_e op, double rhs) {
  switch (op) {
    case Comparison_e::kLt:
      return lhs < rhs;
    case Comparison_e::kLe:
      return lhs <= rhs;
    case Comparison_e::kGt:
      return lhs > rhs;
    case Comparison_e::kGe:
      return lhs >= rhs;
    case Comparison_e::kEq:
      return lhs == rhs;
    case Comparison_e::kNe:
      return lhs != rhs;
  }
  return false;
}

Predicate_t makePropertyPredicate(const std::string& property, Comparison_e op, double threshold) {
  // Fail on construction rather than on the first track.
  const auto& names = Track::scalarPropertyNames();
  if (std::find(names.begin(), names.end(), property) == names.end()) {
    throw ArgumentError(fmt::format("Unknown track property '{}'", property));
  }
  Predicate_t predicate;
  predicate.name = fmt::format("{} {} {}", property, toString(op), threshold);
  predicate.test = [property, op, threshold](const Track& track) {
    return compare(track.scalarProperty(property), op, threshold);
  };
  predicate.definition = {{"property", property}, {"op", toString(op)}, {"value", threshold}};
  return predicate;
}

Predicate_t makeVortexTypePredicate(int code, Comparison_e op, double fraction) {
  Predicate_t predicate;
  predicate.name = fmt::format("vortex_type_fraction[{}] {} {}", code, toString(op), fraction);
  predicate.test = [code, op, fraction](const Track& track) {
    return compare(track.vortexTypeFraction(code), op, fraction);
  };
  predicate.definition = {
      {"property", "vortex_type_fraction"}, {"code", code}, {"op", toString(op)}, {"value", fraction}};
  return predicate;
}

Predicate_t makeColumnPredicate(const std::string& column,
                                const std::string& reduction,
                                Comparison_e op,
                                double threshold) {
  if (reduction != "min" && reduction != "max" && reduction != "mean") {
    throw ArgumentError(fmt::format("reduction={} should be one of min, max, mean", reduction));
  }
  Predicate_t predicate;
  predicate.name = fmt::format("{}({}) {} {}", reduction, column, toString(op), threshold);
  predicate.test = [column, reduction, op, threshold](const Track& track) {
    const ColumnView values = track.column(column);
    double reduced = values.mean();
    if (reduction == "min") {
      reduced = values.minCoeff();
    } else if (reduction == "max") {
      reduced = values.maxCoeff();
    }
    return compare(reduced, op, threshold);
  };
  predicate.definition = {
      {"column", column}, {"reduction", reduction}, {"op", toString(op)}, {"value", threshold}};
  return predicate;
}

Predicate_t makePredicate(std::string name, std::function<bool(const Track&)> test) {
  Predicate_t predicate;
  predicate.name = std::move(name);
  predicate.test = std::move(test);
  return predicate;
}

nlohmann::json toJson(const Rule_t& rule) {
  nlohmann::json conditions = nlohmann::json::array();
  for (const Predicate_t& predicate : rule.predicates) {
    if (predicate.definition.is_null()) {
      throw ArgumentError(
          fmt::format("Rule '{}': predicate '{}' has no declarative form", rule.label, predicate.name));
    }
    conditions.push_back(predicate.definition);
  }
  nlohmann::json node = {{"label", rule.label}, {"conditions", conditions}};
  if (!rule.requiredColumns.empty()) {
    node["requiredColumns"] = rule.requiredColumns;
  }
  return node;
}

} // namespace octant
