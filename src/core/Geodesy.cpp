#include "octant/core/Geodesy.hpp"

#include <algorithm>
#include <cmath>

#include "octant/core/Errors.hpp"

namespace octant {

// Haversine form; the root is clamped to [0, 1] so antipodal points cannot
// push asin outside its domain.
double greatCircle(double lon1, double lat1, double lon2, double lat2, double radiusKm) {
  const double phi1 = lat1 * kDegToRad;
  const double phi2 = lat2 * kDegToRad;
  const double halfDLat = 0.5 * (phi2 - phi1);
  const double halfDLon = 0.5 * (lon2 - lon1) * kDegToRad;

  const double sinLat = std::sin(halfDLat);
  const double sinLon = std::sin(halfDLon);
  const double h = sinLat * sinLat + std::cos(phi1) * std::cos(phi2) * sinLon * sinLon;
  const double root = std::clamp(std::sqrt(std::max(h, 0.0)), 0.0, 1.0);
  return 2.0 * radiusKm * std::asin(root);
}

Vector greatCircle(const Vector& lon1,
                   const Vector& lat1,
                   const Vector& lon2,
                   const Vector& lat2,
                   double radiusKm) {
  const Eigen::Index n = lon1.size();
  if (lat1.size() != n || lon2.size() != n || lat2.size() != n) {
    throw ArgumentError("greatCircle: coordinate arrays must have the same length");
  }
  Vector out(n);
  for (Eigen::Index i = 0; i < n; ++i) {
    out(i) = greatCircle(lon1(i), lat1(i), lon2(i), lat2(i), radiusKm);
  }
  return out;
}

Vector pathSegmentLengths(const Eigen::Ref<const Vector>& lon,
                          const Eigen::Ref<const Vector>& lat,
                          double radiusKm) {
  if (lon.size() != lat.size()) {
    throw ArgumentError("pathSegmentLengths: lon and lat must have the same length");
  }
  const Eigen::Index n = lon.size();
  if (n < 2) {
    return Vector();
  }
  Vector out(n - 1);
  for (Eigen::Index i = 0; i + 1 < n; ++i) {
    out(i) = greatCircle(lon(i), lat(i), lon(i + 1), lat(i + 1), radiusKm);
  }
  return out;
}

double wrapLongitude(double lon, LonRange_e range) {
  double wrapped = std::fmod(lon, 360.0);
  if (wrapped < 0.0) {
    wrapped += 360.0;
  }
  if (range == LonRange_e::kMinus180To180 && wrapped >= 180.0) {
    wrapped -= 360.0;
  }
  return wrapped;
}

} // namespace octant
