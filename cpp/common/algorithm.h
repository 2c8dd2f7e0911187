// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Searching on coordinate axes and NaN aware reductions

#pragma once

#include "eigen.h"

#include <cstdint>
#include <vector>

namespace lstmatch {

// Direction of a coordinate axis
enum class Monotonic
{
    increasing,
    decreasing,
    none,
};

// Whether the axis is strictly increasing or strictly decreasing. An
// axis with a single element counts as increasing. NaN or repeated
// values make it neither.
[[nodiscard]] auto monotonicity(const Eigen::ArrayXd& axis) -> Monotonic;
[[nodiscard]] auto monotonicity(const std::vector<int64_t>& axis)
  -> Monotonic;

// Do a binary search for the index of the axis element closest to x.
// The axis must be strictly monotonic (either direction). Points
// beyond the ends are clamped to the first or last element. When x is
// exactly halfway between two elements the lower index is returned.
// A NaN query returns 0.
[[nodiscard]] auto nearestIdx(const Eigen::ArrayXd& axis,
                              const Monotonic direction,
                              const double x) -> int;
[[nodiscard]] auto nearestIdx(const std::vector<int64_t>& axis,
                              const int64_t x) -> int;

// Mean of the non-NaN elements, NaN if there are none
[[nodiscard]] auto nanMean(const Eigen::ArrayXd& values) -> double;

} // namespace lstmatch
