#pragma once

#include <functional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "octant/track/Track.hpp"

namespace octant {

enum class Comparison_e {
  kLt,
  kLe,
  kGt,
  kGe,
  kEq,
  kNe
};

// Throws ArgumentError for anything but lt|le|gt|ge|eq|ne.
Comparison_e parseComparison(const std::string& value);
std::string toString(Comparison_e op);
bool compare(double lhs, Comparison_e op, double rhs);

// Pure boolean test of a single track. The definition, when present, is the
// declarative form the predicate was built from.
struct Predicate_t {
  std::string name;
  std::function<bool(const Track&)> test;
  nlohmann::json definition;
};

// A category: a track belongs to it when every predicate holds.
struct Rule_t {
  std::string label;
  std::vector<Predicate_t> predicates;
  // Columns the predicates read; checked before any track is evaluated.
  std::vector<std::string> requiredColumns;
};

Predicate_t makePropertyPredicate(const std::string& property, Comparison_e op, double threshold);
Predicate_t makeVortexTypePredicate(int code, Comparison_e op, double fraction);
// Compares a reduction (min|max|mean) of an arbitrary column with a threshold.
Predicate_t makeColumnPredicate(const std::string& column,
                                const std::string& reduction,
                                Comparison_e op,
                                double threshold);
Predicate_t makePredicate(std::string name, std::function<bool(const Track&)> test);

// Declarative form of a rule. Throws ArgumentError when a predicate was built
// from a closure and has no definition.
nlohmann::json toJson(const Rule_t& rule);

} // namespace octant
