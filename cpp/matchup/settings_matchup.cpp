// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "settings_matchup.h"

#include <common/io.h>
#include <spdlog/spdlog.h>

namespace lstmatch {

auto SettingsMatchup::scanKeys() -> void
{
    scan(processing_version);
    scan(compress);

    scan(matchup.match_tolerance);
    scan(matchup.lookback_tolerance);
    scan(matchup.previous_suffix);

    scan(stations.time_column);
    scan(stations.latitude_column);
    scan(stations.longitude_column);
    scan(stations.station_column);
    scan(stations.datetime_columns);
    scan(stations.delimiter);
    scan(stations.filters);
    scan(stations.exclude_columns_with);

    scan(satellite.lst_variable);
    scan(satellite.time_variable);
    scan(satellite.view_time_variable);
    scan(satellite.view_angle_variable);
    scan(satellite.start_date_variable);
    scan(satellite.max_view_angle);
    scan(satellite.view_angle_offset);
    scan(satellite.max_bad_angle_ratio);

    scan(io_files.stations);
    scan(io_files.satellite);
    scan(io_files.matchup);
}

auto SettingsMatchup::checkParameters() -> void
{
    if (matchup.match_tolerance < 0.0) {
        throw std::invalid_argument { matchup.match_tolerance.keyToStr()
                                      + " must not be negative" };
    }
    if (matchup.lookback_tolerance < matchup.match_tolerance) {
        throw std::invalid_argument {
            matchup.lookback_tolerance.keyToStr() + " must not be smaller than "
            + matchup.match_tolerance.keyToStr()
        };
    }
    if (matchup.previous_suffix.empty()) {
        throw std::invalid_argument { matchup.previous_suffix.keyToStr()
                                      + " must not be empty" };
    }
    if (stations.delimiter.size() != 1) {
        throw std::invalid_argument { stations.delimiter.keyToStr()
                                      + " must be a single character" };
    }
    if (const size_t n { stations.datetime_columns.size() };
        n != 1 && (n < 3 || n > 6)) {
        throw std::invalid_argument {
            stations.datetime_columns.keyToStr()
            + " must name one ISO 8601 column or three to six date columns"
        };
    }
    // Throws for malformed filters
    for (const auto& filter : stations.filters) {
        static_cast<void>(parseFilter(filter));
    }
    if (satellite.max_view_angle) {
        if (satellite.max_view_angle.value() < 0.0) {
            throw std::invalid_argument { satellite.max_view_angle.keyToStr()
                                          + " must not be negative" };
        }
        if (satellite.view_time_variable.empty()) {
            spdlog::warn("{} is only used together with {}",
                         satellite.max_view_angle.keyToStr(),
                         satellite.view_time_variable.keyToStr());
        } else if (satellite.view_angle_variable.empty()) {
            throw std::invalid_argument {
                satellite.max_view_angle.keyToStr() + " requires "
                + satellite.view_angle_variable.keyToStr()
            };
        }
    }
    if (satellite.max_bad_angle_ratio <= 0.0
        || satellite.max_bad_angle_ratio > 1.0) {
        throw std::invalid_argument { satellite.max_bad_angle_ratio.keyToStr()
                                      + " must be in (0, 1]" };
    }
    checkPresenceOfFile(io_files.stations, true);
    checkPresenceOfFile(io_files.satellite, true);
    if (io_files.matchup.empty()) {
        throw std::runtime_error { "missing " + io_files.matchup.keyToStr() };
    }
    checkFileWritable(io_files.matchup);
}

auto SettingsMatchup::stationFormat() const -> StationFormat
{
    StationFormat format {};
    format.delimiter = stations.delimiter.front();
    format.station_column = stations.station_column;
    format.time_column = stations.time_column;
    format.datetime_columns = stations.datetime_columns;
    for (const auto& filter : stations.filters) {
        format.filters.push_back(parseFilter(filter));
    }
    format.exclude_columns_with = stations.exclude_columns_with;
    return format;
}

auto SettingsMatchup::matchupOptions() const -> MatchupOptions
{
    MatchupOptions options {};
    // Station columns are normalized on input
    options.schema.time_column = normalizeName(stations.time_column);
    options.schema.latitude_column = normalizeName(stations.latitude_column);
    options.schema.longitude_column = normalizeName(stations.longitude_column);
    options.tolerances.match = matchup.match_tolerance;
    options.tolerances.lookback = matchup.lookback_tolerance;
    options.previous_suffix = matchup.previous_suffix;
    return options;
}

auto SettingsMatchup::satelliteLayout() const -> SatelliteLayout
{
    return { satellite.lst_variable,
             satellite.time_variable,
             satellite.view_time_variable,
             satellite.view_angle_variable,
             satellite.start_date_variable };
}

auto SettingsMatchup::viewAngleFilter() const -> std::optional<ViewAngleFilter>
{
    if (!satellite.max_view_angle) {
        return {};
    }
    return ViewAngleFilter { satellite.max_view_angle.value(),
                             satellite.view_angle_offset,
                             satellite.max_bad_angle_ratio };
}

} // namespace lstmatch
