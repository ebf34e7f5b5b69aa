#include "octant/track/TrackTable.hpp"

#include <algorithm>

#include <fmt/core.h>

#include "octant/core/Errors.hpp"

namespace octant {

TrackTable::TrackTable(std::vector<std::string> columnNames)
    : names(std::move(columnNames)), data(names.size()) {
  for (std::size_t i = 0; i < names.size(); ++i) {
    if (std::find(names.begin() + i + 1, names.end(), names[i]) != names.end()) {
      throw SchemaMismatchError(fmt::format("Duplicate column name '{}'", names[i]));
    }
  }
}

std::vector<std::string> TrackTable::standardColumns() {
  return {columns::kLon, columns::kLat, columns::kVo, columns::kTime, columns::kArea, columns::kVortexType};
}

bool TrackTable::hasColumn(const std::string& name) const {
  return std::find(names.begin(), names.end(), name) != names.end();
}

std::size_t TrackTable::columnIndex(const std::string& name) const {
  const auto it = std::find(names.begin(), names.end(), name);
  if (it == names.end()) {
    throw SchemaMismatchError(fmt::format("Column '{}' is not in the table", name));
  }
  return static_cast<std::size_t>(it - names.begin());
}

ColumnView TrackTable::column(const std::string& name) const {
  return column(columnIndex(name));
}

ColumnView TrackTable::column(std::size_t index) const {
  const std::vector<double>& values = data.at(index);
  return ColumnView(values.data(), static_cast<Eigen::Index>(values.size()));
}

ColumnView TrackTable::column(std::size_t index, const TrackGroup_t& group) const {
  const std::vector<double>& values = data.at(index);
  return ColumnView(values.data() + group.firstRow, static_cast<Eigen::Index>(group.count));
}

long TrackTable::findGroup(int trackId) const {
  const auto it = std::lower_bound(trackGroups.begin(), trackGroups.end(), trackId,
                                   [](const TrackGroup_t& group, int id) { return group.id < id; });
  if (it == trackGroups.end() || it->id != trackId) {
    return -1;
  }
  return static_cast<long>(it - trackGroups.begin());
}

void TrackTable::checkNewId(int trackId) const {
  if (trackId < 0) {
    throw TrackIdError("Track ids must be non-negative", trackId);
  }
  if (!trackGroups.empty() && trackId <= trackGroups.back().id) {
    throw TrackIdError(findGroup(trackId) >= 0 ? "Duplicate track id" : "Track id out of order", trackId);
  }
}

void TrackTable::appendTrack(int trackId, const std::vector<Vector>& values) {
  checkNewId(trackId);
  if (values.size() != names.size()) {
    throw SchemaMismatchError(
        fmt::format("Track {} has {} columns, table has {}", trackId, values.size(), names.size()));
  }
  const Eigen::Index count = values.empty() ? 0 : values.front().size();
  if (count == 0) {
    throw ArgumentError(fmt::format("Track {} has no observations", trackId));
  }
  for (std::size_t c = 0; c < values.size(); ++c) {
    if (values[c].size() != count) {
      throw SchemaMismatchError(fmt::format("Track {}: column '{}' has {} values, expected {}",
                                            trackId, names[c], values[c].size(), count));
    }
  }
  TrackGroup_t group{trackId, trackIdColumn.size(), static_cast<std::size_t>(count)};
  for (std::size_t c = 0; c < values.size(); ++c) {
    data[c].insert(data[c].end(), values[c].data(), values[c].data() + count);
  }
  trackIdColumn.insert(trackIdColumn.end(), group.count, trackId);
  trackGroups.push_back(group);
}

void TrackTable::appendTrack(int trackId, const TrackRecord_t& record) {
  std::vector<Vector> values = {record.lon, record.lat, record.vo, record.time, record.area, record.vortexType};
  for (const auto& extra : record.extra) {
    values.push_back(extra.second);
  }
  appendTrack(trackId, values);
}

void TrackTable::appendTrack(int trackId, const TrackTable& other, const TrackGroup_t& group) {
  if (!sameSchema(other)) {
    throw SchemaMismatchError("Cannot copy a track between tables with different columns");
  }
  checkNewId(trackId);
  TrackGroup_t copied{trackId, trackIdColumn.size(), group.count};
  for (std::size_t c = 0; c < names.size(); ++c) {
    const auto first = other.data[c].begin() + static_cast<std::ptrdiff_t>(group.firstRow);
    data[c].insert(data[c].end(), first, first + static_cast<std::ptrdiff_t>(group.count));
  }
  trackIdColumn.insert(trackIdColumn.end(), group.count, trackId);
  trackGroups.push_back(copied);
}

TrackTable TrackTable::filterRows(const std::vector<bool>& keep) const {
  if (keep.size() != numberOfRows()) {
    throw ArgumentError("filterRows: mask length does not match the number of rows");
  }
  TrackTable out(names);
  for (const TrackGroup_t& group : trackGroups) {
    TrackGroup_t kept{group.id, out.trackIdColumn.size(), 0};
    for (std::size_t row = group.firstRow; row < group.firstRow + group.count; ++row) {
      if (!keep[row]) {
        continue;
      }
      for (std::size_t c = 0; c < names.size(); ++c) {
        out.data[c].push_back(data[c][row]);
      }
      out.trackIdColumn.push_back(group.id);
      ++kept.count;
    }
    if (kept.count > 0) {
      out.trackGroups.push_back(kept);
    }
  }
  return out;
}

void TrackTable::reserve(std::size_t rows) {
  for (auto& values : data) {
    values.reserve(rows);
  }
  trackIdColumn.reserve(rows);
}

} // namespace octant
