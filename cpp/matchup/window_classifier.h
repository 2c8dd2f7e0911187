// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Classification of station rows by the time offset of their grid
// match. A row is a current match if its offset is within the match
// tolerance. A row is a previous anchor if the next row is a current
// match and its own offset is within the lookback tolerance. Only
// current matches preceded by an anchor are kept, so that every kept
// current match pairs with exactly the anchor in front of it.

#pragma once

#include <common/eigen.h>

namespace lstmatch {

// Tolerances in hours, both inclusive
struct WindowTolerances
{
    double match { 1.0 };
    double lookback { 4.0 };
};

struct MatchMasks
{
    ArrayXb is_current_match {};
    ArrayXb is_previous_anchor {};
};

// offset_hours is the station time minus matched time of each row, in
// row order. A NaN offset fails both tolerances. The first row is
// never a current match and the last row never an anchor.
[[nodiscard]] auto classifyWindows(const Eigen::ArrayXd& offset_hours,
                                   const WindowTolerances& tolerances)
  -> MatchMasks;

} // namespace lstmatch
