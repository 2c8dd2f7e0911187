// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#pragma once

#include "matcher.h"
#include "station_series.h"
#include "window_classifier.h"

namespace lstmatch {

// Wide table with one row per (previous anchor, current match) pair of
// one station. columns holds all columns of the current row under
// their own names followed by the columns of the anchor row with a
// suffix. The anchor's latitude and longitude are not repeated.
struct PairedTable
{
    std::string station {};
    Eigen::ArrayXd matched_value {};
    std::vector<int64_t> matched_time {};
    std::vector<Column> columns {};

    [[nodiscard]] auto size() const -> int
    {
        return static_cast<int>(matched_time.size());
    }
};

// Pair the k-th anchor with the k-th current match and drop pairs
// whose current row has no grid value. Throws std::logic_error if an
// anchor is not the immediate predecessor of its current match.
[[nodiscard]] auto joinPairs(const StationSeries& series,
                             const Annotations& annotations,
                             const MatchMasks& masks,
                             const StationSchema& schema,
                             const std::string& previous_suffix)
  -> PairedTable;

} // namespace lstmatch
