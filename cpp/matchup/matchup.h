// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Matching station series with a satellite grid. Each station is
// processed independently: its rows are turned into query keys, looked
// up in the grid in one batch, classified by time offset and joined
// into pairs of (previous anchor, current match).

#pragma once

#include "joiner.h"

namespace lstmatch {

struct MatchupOptions
{
    StationSchema schema {};
    WindowTolerances tolerances {};
    std::string previous_suffix { "_prev" };
};

// A station that could not be processed
struct GroupFailure
{
    std::string station {};
    std::string reason {};
};

struct MatchupResult
{
    // One table per successfully processed station, in input order
    std::vector<PairedTable> pairs {};
    std::vector<GroupFailure> failures {};

    [[nodiscard]] auto nPairs() const -> int;
};

// Process one station. Throws std::invalid_argument if the series
// fails validateSeries.
[[nodiscard]] auto matchStation(const SatelliteGrid& grid,
                                const StationSeries& series,
                                const MatchupOptions& options) -> PairedTable;

// Process all stations in parallel. A station whose processing throws
// is recorded as a failure and does not affect the others.
[[nodiscard]] auto matchAll(const SatelliteGrid& grid,
                            const std::vector<StationSeries>& stations,
                            const MatchupOptions& options) -> MatchupResult;

} // namespace lstmatch
