#pragma once

#include <vector>

#include <nlohmann/json.hpp>

#include "octant/classify/Classifier.hpp"
#include "octant/classify/Rule.hpp"

namespace octant {

// Builds a predicate from {"property": ..., "op": ..., "value": ...} or
// {"column": ..., "reduction": ..., "op": ..., "value": ...}.
Predicate_t createPredicate(const nlohmann::json& conditionNode);

// Builds one rule from {"label": ..., "conditions": [...], "requiredColumns": [...]}.
Rule_t createRule(const nlohmann::json& ruleNode);

// Builds the rule list of a "rules" array.
std::vector<Rule_t> createRules(const nlohmann::json& rulesNode);

// Reads the "classify" options section (inclusive, clear, logEvery).
ClassifyOptions_t createClassifyOptions(const nlohmann::json& optionsNode);

} // namespace octant
