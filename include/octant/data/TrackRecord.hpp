#pragma once

#include <string>
#include <utility>
#include <vector>

#include "octant/core/Types.hpp"

namespace octant {

// Standard column names shared by records, tables and tracks.
namespace columns {
constexpr const char* kLon = "lon";
constexpr const char* kLat = "lat";
constexpr const char* kVo = "vo";
constexpr const char* kTime = "time";
constexpr const char* kArea = "area";
constexpr const char* kVortexType = "vortex_type";
} // namespace columns

// One parsed track as handed over by a loader. Time is in seconds since the
// Unix epoch.
struct TrackRecord_t {
  int rawId = -1;
  Vector lon;
  Vector lat;
  Vector vo;
  Vector time;
  Vector area;
  Vector vortexType;
  // Optional extra per-observation columns, appended after the standard ones.
  std::vector<std::pair<std::string, Vector>> extra;

  Eigen::Index size() const { return lon.size(); }
};

} // namespace octant
