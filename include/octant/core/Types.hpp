#pragma once

#include <Eigen/Dense>

namespace octant {
using Vector = Eigen::VectorXd;
// Two-column (lon, lat) array in observation order.
using LonLatArray = Eigen::Matrix<double, Eigen::Dynamic, 2>;
} // namespace octant
