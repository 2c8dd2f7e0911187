// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#pragma once

#include "satellite_grid.h"
#include "station_series.h"

namespace lstmatch {

// One query key per row of the series, ordered by time (stable) for
// the grid lookup. The y and x of a key are the latitude and
// longitude of the row and index is its position in the series.
[[nodiscard]] auto selectKeys(const StationSeries& series,
                              const StationSchema& schema)
  -> std::vector<QueryKey>;

} // namespace lstmatch
