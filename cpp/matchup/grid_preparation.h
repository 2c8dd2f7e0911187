// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Turn a stack of raw satellite scenes into a time ordered LST grid.
// A raw scene only carries the date of acquisition. Its time of day
// is derived from a view time band (hour of day per pixel).

#pragma once

#include "satellite_grid.h"

#include <optional>

namespace lstmatch {

// All 2D arrays have dimensions (scene, y * x)
struct SceneStack
{
    // Acquisition start of each scene
    std::vector<int64_t> start_dates {};
    Eigen::ArrayXd y {};
    Eigen::ArrayXd x {};
    ArrayXXd lst {};
    // Hour of day, NaN where not observed
    ArrayXXd view_time {};
    // Empty if the file has no view angle band
    ArrayXXd view_angle {};
};

struct ViewAngleFilter
{
    // Pixels with a zenith angle above this are counted as bad
    double max_view_angle { 40.0 };
    // zenith angle = |view angle + offset|
    double view_angle_offset { -65.0 };
    // Scenes are kept if the fraction of bad pixels is below this
    double max_bad_angle_ratio { 0.1 };
};

// Time of each scene: the start date floored to the day plus the mean
// view hour over all observed pixels, rounded to a whole hour (half to
// even). No value if the scene has no observed pixel.
[[nodiscard]] auto sceneTimes(const SceneStack& scenes)
  -> std::vector<std::optional<int64_t>>;

// Which scenes pass the view angle filter. A scene without any valid
// view angle fails.
[[nodiscard]] auto viewAngleMask(const ArrayXXd& view_angle,
                                 const ViewAngleFilter& filter) -> ArrayXb;

// Assign times, drop scenes without a time, average scenes sharing a
// time pixel by pixel ignoring NaN, sort by time and, if a filter is
// given, drop scenes with too many bad view angles.
[[nodiscard]] auto prepareGrid(const SceneStack& scenes,
                               const std::optional<ViewAngleFilter>& filter)
  -> GriddedLST;

} // namespace lstmatch
