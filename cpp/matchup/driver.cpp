// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "driver.h"

#include "grid_io.h"
#include "matchup.h"
#include "product_io.h"
#include "settings_matchup.h"
#include "station_io.h"

#include <common/io.h>
#include <common/time.h>
#include <common/timer.h>
#include <spdlog/spdlog.h>

namespace lstmatch {

auto driver(const SettingsMatchup& settings,
            const int argc,
            const char* const argv[]) -> void
{
    // Set up loggers and print general information
    initLogging();
    printHeading("LST matchup processor", false);
    printSystemInfo(LSTMATCH_PROJECT_VERSION,
                    LSTMATCH_GIT_COMMIT_ABBREV,
                    LSTMATCH_CMAKE_HOST_SYSTEM,
                    LSTMATCH_EXECUTABLE,
                    LSTMATCH_CXX_COMPILER,
                    LSTMATCH_CXX_COMPILER_FLAGS,
                    LSTMATCH_LIBRARIES);

    Timer timer_total { "Total time" };
    Timer timer_input { "Reading input" };
    Timer timer_matchup { "Matching" };
    timer_total.start();

    // Satellite grid
    printHeading("Reading input data");
    timer_input.start();
    spdlog::info("Satellite data: {}", settings.io_files.satellite.c_str());
    const GriddedLST grid { readSatelliteGrid(settings.io_files.satellite,
                                              settings.satelliteLayout(),
                                              settings.viewAngleFilter()) };
    spdlog::info("Grid time span: {} to {}",
                 formatTimestamp(grid.firstTime()),
                 formatTimestamp(grid.lastTime()));
    const auto resolution { grid.resolutionMetres() };
    spdlog::info("Approximate grid resolution (y, x): ({}, {}) m",
                 resolution[0],
                 resolution[1]);

    // Station observations, restricted to the period of the grid
    spdlog::info("Station data: {}", settings.io_files.stations.c_str());
    const MatchupOptions options { settings.matchupOptions() };
    std::vector<StationSeries> stations {};
    for (const auto& series :
         readStations(settings.io_files.stations, settings.stationFormat())) {
        stations.push_back(restrictToTimeSpan(series,
                                              options.schema.time_column,
                                              grid.firstTime(),
                                              grid.lastTime()));
    }
    timer_input.stop();

    printHeading("Matching");
    timer_matchup.start();
    const MatchupResult result { matchAll(grid, stations, options) };
    timer_matchup.stop();
    spdlog::info("Number of pairs: {}", result.nPairs());
    if (!result.failures.empty()) {
        spdlog::warn("Number of stations skipped: {}", result.failures.size());
    }

    spdlog::info("");
    spdlog::info("Writing output");
    writeMatchup(settings.io_files.matchup,
                 settings.getConfig(),
                 result,
                 settings.compress,
                 argc,
                 argv);

    timer_total.stop();
    spdlog::info("");
    timer_input.report();
    timer_matchup.report();
    timer_total.report();

    printHeading("Success");
}

} // namespace lstmatch
