#include "octant/track/Track.hpp"

#include <cmath>
#include <functional>
#include <limits>
#include <map>

#include "octant/core/Errors.hpp"
#include "octant/core/Geodesy.hpp"

namespace octant {

namespace {

using PropertyFn = std::function<double(const Track&)>;

const std::map<std::string, PropertyFn>& propertyTable() {
  static const std::map<std::string, PropertyFn> table = {
      {"lifetime_h", [](const Track& t) { return t.lifetimeH(); }},
      {"total_dist_km", [](const Track& t) { return t.totalDistKm(); }},
      {"gen_lys_dist_km", [](const Track& t) { return t.genLysDistKm(); }},
      {"average_speed", [](const Track& t) { return t.averageSpeed(); }},
      {"max_vort", [](const Track& t) { return t.maxVort(); }},
      {"mean_vort", [](const Track& t) { return t.meanVort(); }},
      {"n_obs", [](const Track& t) { return static_cast<double>(t.size()); }},
      {"genesis_lon", [](const Track& t) { return t.lon()(0); }},
      {"genesis_lat", [](const Track& t) { return t.lat()(0); }},
      {"lysis_lon", [](const Track& t) { return t.lon()(t.lon().size() - 1); }},
      {"lysis_lat", [](const Track& t) { return t.lat()(t.lat().size() - 1); }},
  };
  return table;
}

} // namespace

Track::Track(const TrackTable& table, const TrackGroup_t& group) : table(&table), group(group) {}

ColumnView Track::column(const std::string& name) const {
  return table->column(table->columnIndex(name), group);
}

ColumnView Track::lon() const {
  return column(columns::kLon);
}

ColumnView Track::lat() const {
  return column(columns::kLat);
}

ColumnView Track::vo() const {
  return column(columns::kVo);
}

ColumnView Track::time() const {
  return column(columns::kTime);
}

double Track::firstTime() const {
  return time()(0);
}

double Track::lastTime() const {
  const ColumnView t = time();
  return t(t.size() - 1);
}

LonLatArray Track::lonlat() const {
  LonLatArray out(static_cast<Eigen::Index>(group.count), 2);
  out.col(0) = lon();
  out.col(1) = lat();
  return out;
}

CoordView_t Track::coordView() const {
  return CoordView_t{lon(), lat(), time()};
}

double Track::lifetimeH() const {
  return (lastTime() - firstTime()) / kSecondsPerHour;
}

double Track::totalDistKm() const {
  return pathSegmentLengths(lon(), lat()).sum();
}

double Track::genLysDistKm() const {
  const ColumnView x = lon();
  const ColumnView y = lat();
  const Eigen::Index last = x.size() - 1;
  return greatCircle(x(0), y(0), x(last), y(last));
}

double Track::averageSpeed() const {
  const double hours = lifetimeH();
  if (hours <= 0.0) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  return totalDistKm() / hours;
}

double Track::maxVort() const {
  return vo().maxCoeff();
}

double Track::meanVort() const {
  return vo().mean();
}

double Track::vortexTypeFraction(int code) const {
  const ColumnView types = column(columns::kVortexType);
  const auto matches = (types.array() == static_cast<double>(code)).count();
  return static_cast<double>(matches) / static_cast<double>(types.size());
}

double Track::scalarProperty(const std::string& name) const {
  const auto& properties = propertyTable();
  const auto it = properties.find(name);
  if (it == properties.end()) {
    throw ArgumentError("Unknown track property '" + name + "'");
  }
  return it->second(*this);
}

const std::vector<std::string>& Track::scalarPropertyNames() {
  static const std::vector<std::string> names = [] {
    std::vector<std::string> out;
    for (const auto& entry : propertyTable()) {
      out.push_back(entry.first);
    }
    return out;
  }();
  return names;
}

} // namespace octant
