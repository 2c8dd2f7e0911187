// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#pragma once

#include <Eigen/Dense>

// Row-major storage is used for all 2D arrays. A satellite scene
// stack of dimensions (time, y, x) is stored as (time, y * x) so that
// one row is one scene, which is also the order in which NetCDF
// stores the variable.
using ArrayXXd =
  Eigen::Array<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

using ArrayXb = Eigen::Array<bool, Eigen::Dynamic, 1>;
