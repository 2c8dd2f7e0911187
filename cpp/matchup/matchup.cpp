// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "matchup.h"

#include "selector.h"

#include <common/io.h>
#include <optional>
#include <spdlog/spdlog.h>

namespace lstmatch {

auto MatchupResult::nPairs() const -> int
{
    int n {};
    for (const auto& table : pairs) {
        n += table.size();
    }
    return n;
}

auto matchStation(const SatelliteGrid& grid,
                  const StationSeries& series,
                  const MatchupOptions& options) -> PairedTable
{
    validateSeries(series, options.schema);
    const auto& times {
        series.column(options.schema.time_column, ColumnType::time).times
    };
    const auto keys { selectKeys(series, options.schema) };
    const auto samples { matchKeys(grid, keys, series.size()) };
    const Annotations annotations { annotate(times, samples) };
    const MatchMasks masks { classifyWindows(annotations.time_offset_hours,
                                             options.tolerances) };
    return joinPairs(series,
                     annotations,
                     masks,
                     options.schema,
                     options.previous_suffix);
}

auto matchAll(const SatelliteGrid& grid,
              const std::vector<StationSeries>& stations,
              const MatchupOptions& options) -> MatchupResult
{
    const int n_stations { static_cast<int>(stations.size()) };
    // One slot per station so that the result does not depend on
    // thread scheduling
    std::vector<std::optional<PairedTable>> tables(n_stations);
    std::vector<std::string> errors(n_stations);
#pragma omp parallel for schedule(dynamic)
    for (int i_station = 0; i_station < n_stations; ++i_station) {
        printPercentage(i_station, n_stations, "Matching stations:");
        try {
            tables[i_station] =
              matchStation(grid, stations[i_station], options);
        } catch (const std::exception& e) {
            errors[i_station] = e.what();
        }
    }
    spdlog::info("Matching stations: 100.00%");

    MatchupResult result {};
    for (int i_station {}; i_station < n_stations; ++i_station) {
        if (tables[i_station]) {
            result.pairs.push_back(std::move(*tables[i_station]));
        } else {
            spdlog::warn("Station {} skipped: {}",
                         stations[i_station].station,
                         errors[i_station]);
            result.failures.push_back(
              { stations[i_station].station, errors[i_station] });
        }
    }
    return result;
}

} // namespace lstmatch
