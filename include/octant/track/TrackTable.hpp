#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "octant/core/Types.hpp"
#include "octant/data/TrackRecord.hpp"

namespace octant {

using ColumnView = Eigen::Map<const Vector>;

// Contiguous block of rows belonging to one track.
struct TrackGroup_t {
  int id = -1;
  std::size_t firstRow = 0;
  std::size_t count = 0;
};

// Columnar store of observations grouped by a mandatory track id. Rows of a
// track are contiguous and tracks are kept in ascending id order.
class TrackTable {
public:
  TrackTable() = default;
  explicit TrackTable(std::vector<std::string> columnNames);

  // Schema used for loaded tracks: the standard columns plus any extras.
  static std::vector<std::string> standardColumns();

  const std::vector<std::string>& columnNames() const { return names; }
  std::size_t numberOfColumns() const { return names.size(); }
  std::size_t numberOfRows() const { return trackIdColumn.size(); }
  std::size_t numberOfTracks() const { return trackGroups.size(); }
  bool empty() const { return trackGroups.empty(); }

  bool hasColumn(const std::string& name) const;
  // Throws SchemaMismatchError when the column does not exist.
  std::size_t columnIndex(const std::string& name) const;
  ColumnView column(const std::string& name) const;
  ColumnView column(std::size_t index) const;
  ColumnView column(std::size_t index, const TrackGroup_t& group) const;

  const std::vector<int>& trackIds() const { return trackIdColumn; }
  const std::vector<TrackGroup_t>& groups() const { return trackGroups; }
  // Position of the group with the given id, or -1.
  long findGroup(int trackId) const;
  int lastTrackId() const { return trackGroups.empty() ? -1 : trackGroups.back().id; }

  bool sameSchema(const TrackTable& other) const { return names == other.names; }

  // values[i] holds the observations of columnNames()[i].
  void appendTrack(int trackId, const std::vector<Vector>& values);
  void appendTrack(int trackId, const TrackRecord_t& record);
  // Copies one group of another table with an identical schema.
  void appendTrack(int trackId, const TrackTable& other, const TrackGroup_t& group);

  // Keeps the flagged rows; tracks left without rows are dropped.
  TrackTable filterRows(const std::vector<bool>& keep) const;

  void reserve(std::size_t rows);

private:
  void checkNewId(int trackId) const;

  std::vector<std::string> names;
  std::vector<std::vector<double>> data;
  std::vector<int> trackIdColumn;
  std::vector<TrackGroup_t> trackGroups;
};

} // namespace octant
