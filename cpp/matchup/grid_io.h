// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Reading the satellite LST grid from a NetCDF file

#pragma once

#include "grid_preparation.h"

#include <string>

namespace lstmatch {

// Names of the variables in the satellite file. If view_time_variable
// is empty the file holds a prepared grid: a time coordinate
// (time_variable) and LST of dimensions (time, y, x). Otherwise it
// holds a raw scene stack: start dates (start_date_variable) and
// bands of dimensions (scene, y, x) for LST, view time and optionally
// view angle. In both cases the coordinates are called y and x and
// times are seconds since 1970-01-01T00:00:00Z.
struct SatelliteLayout
{
    std::string lst_variable { "lst" };
    std::string time_variable { "time" };
    std::string view_time_variable {};
    std::string view_angle_variable {};
    std::string start_date_variable { "start_date" };
};

// Read a raw scene stack. Values equal to a variable's _FillValue are
// replaced by NaN.
[[nodiscard]] auto readSceneStack(const std::string& filename,
                                  const SatelliteLayout& layout)
  -> SceneStack;

// Read a prepared grid, or read a scene stack and prepare it
[[nodiscard]] auto readSatelliteGrid(
  const std::string& filename,
  const SatelliteLayout& layout,
  const std::optional<ViewAngleFilter>& filter) -> GriddedLST;

} // namespace lstmatch
