#include "octant/track/TrackSettings.hpp"

#include "octant/core/Errors.hpp"

namespace octant {

TrackSettings TrackSettings::fromJson(const nlohmann::json& node) {
  TrackSettings settings;
  if (node.is_null()) {
    return settings;
  }
  if (!node.is_object()) {
    throw ArgumentError("Track settings must be a JSON object");
  }
  for (auto it = node.begin(); it != node.end(); ++it) {
    settings.set(it.key(), it.value());
  }
  return settings;
}

nlohmann::json TrackSettings::toJson() const {
  nlohmann::json node = nlohmann::json::object();
  for (const auto& entry : values) {
    node[entry.first] = entry.second;
  }
  return node;
}

void TrackSettings::set(const std::string& key, const nlohmann::json& value) {
  if (!value.is_primitive()) {
    throw ArgumentError("Track setting '" + key + "' must be a scalar value");
  }
  values[key] = value;
}

const nlohmann::json& TrackSettings::get(const std::string& key) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    throw ArgumentError("Track setting '" + key + "' is not defined");
  }
  return it->second;
}

std::vector<std::string> TrackSettings::keys() const {
  std::vector<std::string> out;
  out.reserve(values.size());
  for (const auto& entry : values) {
    out.push_back(entry.first);
  }
  return out;
}

void TrackSettings::merge(const TrackSettings& other) {
  for (const auto& entry : other.values) {
    values[entry.first] = entry.second;
  }
}

} // namespace octant
