#pragma once

#include "octant/core/Types.hpp"

namespace octant {

constexpr double kEarthRadiusKm = 6371.009;
constexpr double kPi = 3.14159265358979323846;
constexpr double kDegToRad = kPi / 180.0;

// Canonical longitude interval for stored observations.
enum class LonRange_e {
  k0To360,
  kMinus180To180
};

// Great-circle distance (km) between two points given in degrees.
double greatCircle(double lon1, double lat1, double lon2, double lat2, double radiusKm = kEarthRadiusKm);

// Element-wise great-circle distance between two equally sized coordinate arrays.
Vector greatCircle(const Vector& lon1,
                   const Vector& lat1,
                   const Vector& lon2,
                   const Vector& lat2,
                   double radiusKm = kEarthRadiusKm);

// Distances between consecutive points of a path; size is n - 1 (empty for n < 2).
Vector pathSegmentLengths(const Eigen::Ref<const Vector>& lon,
                          const Eigen::Ref<const Vector>& lat,
                          double radiusKm = kEarthRadiusKm);

double wrapLongitude(double lon, LonRange_e range);

} // namespace octant
