#pragma once

#include <memory>
#include <vector>

#include "octant/track/TrackRange.hpp"
#include "octant/track/TrackTable.hpp"

namespace octant {

// Read-only selection of tracks that shares the columns of the run it was
// taken from. It keeps those columns alive, so it stays valid after the run
// itself changes.
class TrackRunView {
public:
  TrackRunView() = default;
  TrackRunView(std::shared_ptr<const TrackTable> table, std::vector<std::size_t> positions);

  std::size_t size() const { return positions.size(); }
  bool empty() const { return positions.empty(); }
  const std::vector<std::string>& columns() const;
  std::vector<int> ids() const;
  bool contains(int trackId) const;
  // Throws TrackIdError when the track is not part of the view.
  Track track(int trackId) const;
  TrackRange groups() const { return TrackRange(table, positions); }
  // Observations of all selected tracks.
  std::size_t numberOfObservations() const;
  LonLatArray lonlat() const;

  const std::vector<std::size_t>& trackPositions() const { return positions; }
  const TrackTable* sharedTable() const { return table.get(); }

private:
  std::shared_ptr<const TrackTable> table;
  std::vector<std::size_t> positions;
};

} // namespace octant
