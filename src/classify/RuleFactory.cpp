#include "octant/classify/RuleFactory.hpp"

#include <string>

#include <fmt/core.h>

#include "octant/core/Errors.hpp"
#include "octant/core/Logger.hpp"

namespace octant {

namespace {

std::string requireString(const nlohmann::json& node, const std::string& key, const std::string& context) {
  auto it = node.find(key);
  if (it == node.end() || !it->is_string()) {
    throw ArgumentError(fmt::format("{}: '{}' must be a string", context, key));
  }
  return it->get<std::string>();
}

double requireDouble(const nlohmann::json& node, const std::string& key, const std::string& context) {
  auto it = node.find(key);
  if (it == node.end() || !it->is_number()) {
    throw ArgumentError(fmt::format("{}: '{}' must be a number", context, key));
  }
  return it->get<double>();
}

bool getBool(const nlohmann::json& node, const std::string& key, bool fallback) {
  if (!node.is_object()) {
    return fallback;
  }
  auto it = node.find(key);
  if (it == node.end() || !it->is_boolean()) {
    return fallback;
  }
  return it->get<bool>();
}

} // namespace

Predicate_t createPredicate(const nlohmann::json& conditionNode) {
  if (!conditionNode.is_object()) {
    throw ArgumentError("Rule condition must be a JSON object");
  }
  const std::string context = fmt::format("condition {}", conditionNode.dump());
  const Comparison_e op = parseComparison(requireString(conditionNode, "op", context));
  const double value = requireDouble(conditionNode, "value", context);

  if (conditionNode.contains("column")) {
    const std::string column = requireString(conditionNode, "column", context);
    const std::string reduction = conditionNode.value("reduction", std::string("mean"));
    return makeColumnPredicate(column, reduction, op, value);
  }

  const std::string property = requireString(conditionNode, "property", context);
  if (property == "vortex_type_fraction") {
    const int code = static_cast<int>(requireDouble(conditionNode, "code", context));
    return makeVortexTypePredicate(code, op, value);
  }
  return makePropertyPredicate(property, op, value);
}

Rule_t createRule(const nlohmann::json& ruleNode) {
  if (!ruleNode.is_object()) {
    throw ArgumentError("Rule must be a JSON object");
  }
  Rule_t rule;
  rule.label = requireString(ruleNode, "label", "rule");
  auto conditionsIt = ruleNode.find("conditions");
  if (conditionsIt == ruleNode.end() || !conditionsIt->is_array()) {
    throw ArgumentError(fmt::format("Rule '{}': 'conditions' must be an array", rule.label));
  }
  for (const auto& conditionNode : *conditionsIt) {
    rule.predicates.push_back(createPredicate(conditionNode));
    if (conditionNode.contains("column")) {
      rule.requiredColumns.push_back(conditionNode.at("column").get<std::string>());
    }
  }
  auto columnsIt = ruleNode.find("requiredColumns");
  if (columnsIt != ruleNode.end() && columnsIt->is_array()) {
    for (const auto& column : *columnsIt) {
      rule.requiredColumns.push_back(column.get<std::string>());
    }
  }
  if (auto logger = Logger::GetClass("RuleFactory")) {
    logger->debug("RuleFactory: rule '{}' with {} conditions", rule.label, rule.predicates.size());
  }
  return rule;
}

std::vector<Rule_t> createRules(const nlohmann::json& rulesNode) {
  std::vector<Rule_t> rules;
  if (rulesNode.is_null()) {
    return rules;
  }
  if (!rulesNode.is_array()) {
    throw ArgumentError("'rules' must be an array");
  }
  for (const auto& ruleNode : rulesNode) {
    rules.push_back(createRule(ruleNode));
  }
  return rules;
}

ClassifyOptions_t createClassifyOptions(const nlohmann::json& optionsNode) {
  ClassifyOptions_t options;
  options.inclusive = getBool(optionsNode, "inclusive", options.inclusive);
  options.clear = getBool(optionsNode, "clear", options.clear);
  if (optionsNode.is_object()) {
    options.logEvery = optionsNode.value("logEvery", options.logEvery);
  }
  return options;
}

} // namespace octant
