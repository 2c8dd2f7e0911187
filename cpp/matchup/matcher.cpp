// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "matcher.h"

#include <common/time.h>
#include <stdexcept>

namespace lstmatch {

auto matchKeys(const SatelliteGrid& grid,
               const std::vector<QueryKey>& keys,
               const int n_rows) -> std::vector<GridSample>
{
    if (static_cast<int>(keys.size()) != n_rows) {
        throw std::logic_error { "expected one query key per row" };
    }
    const auto samples { grid.nearest(keys) };
    if (samples.size() != keys.size()) {
        throw std::logic_error { "grid returned "
                                 + std::to_string(samples.size())
                                 + " samples for "
                                 + std::to_string(keys.size()) + " keys" };
    }
    // Scatter back to row order, each row exactly once
    std::vector<GridSample> ordered(keys.size());
    std::vector<bool> seen(keys.size(), false);
    for (size_t i {}; i < keys.size(); ++i) {
        const int row { keys[i].index };
        if (row < 0 || row >= n_rows || seen[row]) {
            throw std::logic_error { "query key indices do not map one to "
                                     "one onto the station rows" };
        }
        seen[row] = true;
        ordered[row] = samples[i];
    }
    return ordered;
}

auto annotate(const std::vector<int64_t>& times,
              const std::vector<GridSample>& samples) -> Annotations
{
    if (times.size() != samples.size()) {
        throw std::logic_error { "expected one grid sample per station time" };
    }
    const int n { static_cast<int>(times.size()) };
    Annotations annotations {};
    annotations.matched_value.resize(n);
    annotations.matched_time.resize(n);
    annotations.time_offset_hours.resize(n);
    for (int i {}; i < n; ++i) {
        annotations.matched_value(i) = samples[i].value;
        annotations.matched_time[i] = samples[i].time;
        annotations.time_offset_hours(i) =
          hoursBetween(times[i], samples[i].time);
    }
    return annotations;
}

} // namespace lstmatch
