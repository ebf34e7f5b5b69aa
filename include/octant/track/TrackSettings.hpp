#pragma once

#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace octant {

// Key -> scalar parameters of the tracking run that produced the data. The
// library stores and merges them without interpreting their meaning.
class TrackSettings {
public:
  TrackSettings() = default;

  // Accepts an object whose values are numbers, strings, booleans or null.
  static TrackSettings fromJson(const nlohmann::json& node);
  nlohmann::json toJson() const;

  void set(const std::string& key, const nlohmann::json& value);
  bool has(const std::string& key) const { return values.count(key) > 0; }
  // Throws ArgumentError when the key is absent.
  const nlohmann::json& get(const std::string& key) const;
  std::vector<std::string> keys() const;

  // Copies every entry of other; on conflicting keys other wins.
  void merge(const TrackSettings& other);

  bool empty() const { return values.empty(); }
  std::size_t size() const { return values.size(); }

  bool operator==(const TrackSettings& other) const { return values == other.values; }
  bool operator!=(const TrackSettings& other) const { return !(*this == other); }

private:
  std::map<std::string, nlohmann::json> values;
};

} // namespace octant
