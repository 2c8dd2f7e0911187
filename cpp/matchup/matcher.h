// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#pragma once

#include "satellite_grid.h"

namespace lstmatch {

// Grid lookup results attached to the rows of a station series
struct Annotations
{
    Eigen::ArrayXd matched_value {};
    std::vector<int64_t> matched_time {};
    // Station time minus matched time
    Eigen::ArrayXd time_offset_hours {};
};

// Look up all keys in one call to the grid and return the samples in
// row order, i.e. sample i belongs to the key with index i. n_rows is
// the length of the series the keys were made from. Throws
// std::logic_error if the key indices are not a permutation of
// 0..n_rows-1 or the grid returns the wrong number of samples.
[[nodiscard]] auto matchKeys(const SatelliteGrid& grid,
                             const std::vector<QueryKey>& keys,
                             const int n_rows) -> std::vector<GridSample>;

// Combine station times with their samples
[[nodiscard]] auto annotate(const std::vector<int64_t>& times,
                            const std::vector<GridSample>& samples)
  -> Annotations;

} // namespace lstmatch
