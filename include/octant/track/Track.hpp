#pragma once

#include <string>

#include "octant/core/Types.hpp"
#include "octant/track/TrackTable.hpp"

namespace octant {

constexpr double kSecondsPerHour = 3600.0;

// (lon, lat, time) arrays of a track, in observation order.
struct CoordView_t {
  Vector lon;
  Vector lat;
  Vector time;
};

// Read-only view of one track inside a TrackTable. The table must outlive the
// view and must not be modified while the view is in use.
class Track {
public:
  Track(const TrackTable& table, const TrackGroup_t& group);

  int id() const { return group.id; }
  std::size_t size() const { return group.count; }
  const std::vector<std::string>& columnNames() const { return table->columnNames(); }
  bool hasColumn(const std::string& name) const { return table->hasColumn(name); }
  // Throws SchemaMismatchError for an unknown column.
  ColumnView column(const std::string& name) const;

  ColumnView lon() const;
  ColumnView lat() const;
  ColumnView vo() const;
  ColumnView time() const;
  double firstTime() const;
  double lastTime() const;

  LonLatArray lonlat() const;
  CoordView_t coordView() const;

  // Elapsed hours between genesis and lysis.
  double lifetimeH() const;
  // Cumulative path length.
  double totalDistKm() const;
  // Straight great-circle distance between genesis and lysis.
  double genLysDistKm() const;
  // Mean propagation speed in km/h; NaN when the lifetime is zero.
  double averageSpeed() const;
  double maxVort() const;
  double meanVort() const;
  // Share of observations whose vortex type equals the given code.
  double vortexTypeFraction(int code) const;

  // Scalar property by its snake_case name, e.g. "lifetime_h". Throws
  // ArgumentError for unknown names.
  double scalarProperty(const std::string& name) const;
  static const std::vector<std::string>& scalarPropertyNames();

private:
  const TrackTable* table = nullptr;
  TrackGroup_t group;
};

} // namespace octant
