#include "octant/track/TrackRunView.hpp"

#include <algorithm>

#include "octant/core/Errors.hpp"

namespace octant {

namespace {

const std::vector<std::string> kNoColumns;

} // namespace

TrackRunView::TrackRunView(std::shared_ptr<const TrackTable> table, std::vector<std::size_t> positions)
    : table(std::move(table)), positions(std::move(positions)) {}

const std::vector<std::string>& TrackRunView::columns() const {
  return table ? table->columnNames() : kNoColumns;
}

std::vector<int> TrackRunView::ids() const {
  std::vector<int> out;
  out.reserve(positions.size());
  for (std::size_t position : positions) {
    out.push_back(table->groups()[position].id);
  }
  return out;
}

bool TrackRunView::contains(int trackId) const {
  if (!table) {
    return false;
  }
  const long position = table->findGroup(trackId);
  return position >= 0 &&
         std::find(positions.begin(), positions.end(), static_cast<std::size_t>(position)) != positions.end();
}

Track TrackRunView::track(int trackId) const {
  if (!contains(trackId)) {
    throw TrackIdError("Track is not part of this selection", trackId);
  }
  return Track(*table, table->groups()[static_cast<std::size_t>(table->findGroup(trackId))]);
}

std::size_t TrackRunView::numberOfObservations() const {
  std::size_t total = 0;
  for (std::size_t position : positions) {
    total += table->groups()[position].count;
  }
  return total;
}

LonLatArray TrackRunView::lonlat() const {
  LonLatArray out(static_cast<Eigen::Index>(numberOfObservations()), 2);
  if (out.rows() == 0) {
    return out;
  }
  const std::size_t lonIndex = table->columnIndex(columns::kLon);
  const std::size_t latIndex = table->columnIndex(columns::kLat);
  Eigen::Index row = 0;
  for (std::size_t position : positions) {
    const TrackGroup_t& group = table->groups()[position];
    const auto n = static_cast<Eigen::Index>(group.count);
    out.block(row, 0, n, 1) = table->column(lonIndex, group);
    out.block(row, 1, n, 1) = table->column(latIndex, group);
    row += n;
  }
  return out;
}

} // namespace octant
