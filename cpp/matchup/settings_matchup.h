// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Class for storing all configuration parameters of the matchup
// processor

#pragma once

#include "grid_io.h"
#include "matchup.h"
#include "station_io.h"

#include <common/settings.h>

namespace lstmatch {

class SettingsMatchup : public Settings
{
private:
    auto checkParameters() -> void override;

public:
    Setting<std::string> processing_version {
        { "processing_version" },
        {},
        "processing toolchain version, stored in the output"
    };
    Setting<bool> compress { { "compress" },
                             true,
                             "whether to compress the matchup product" };

    struct
    {
        Setting<double> match_tolerance {
            { "matchup", "match_tolerance" },
            1.0,
            "maximum time difference, in hours, between a station\n"
            "observation and its nearest satellite overpass for the\n"
            "observation to count as a match (inclusive)"
        };
        Setting<double> lookback_tolerance {
            { "matchup", "lookback_tolerance" },
            4.0,
            "maximum time difference, in hours, between the observation\n"
            "preceding a match and its own nearest satellite overpass\n"
            "(inclusive)"
        };
        Setting<std::string> previous_suffix {
            { "matchup", "previous_suffix" },
            "_prev",
            "suffix of the columns taken from the preceding observation"
        };
    } matchup;

    struct
    {
        Setting<std::string> time_column {
            { "stations", "time_column" },
            "datetime",
            "name given to the timestamp assembled from datetime_columns"
        };
        Setting<std::string> latitude_column { { "stations",
                                                 "latitude_column" },
                                               "latitude",
                                               "" };
        Setting<std::string> longitude_column { { "stations",
                                                  "longitude_column" },
                                                "longitude",
                                                "" };
        Setting<std::string> station_column {
            { "stations", "station_column" },
            "station_name",
            "column identifying the station of an observation"
        };
        Setting<std::vector<std::string>> datetime_columns {
            { "stations", "datetime_columns" },
            { "year", "month", "day", "hour", "minute" },
            "columns holding year, month, day and optionally hour, minute\n"
            "and second, in this order, or a single column holding ISO 8601\n"
            "timestamps (YYYY-mm-ddTHH:MM:SS)"
        };
        Setting<std::string> delimiter { { "stations", "delimiter" },
                                         ",",
                                         "field separator, one character" };
        Setting<std::vector<std::vector<std::string>>> filters {
            { "stations", "filters" },
            {},
            "rows to keep, each filter is [column, operator, value] with\n"
            "operator one of <, <=, >, >=, ==, !=, e.g. [year, \">\", 2015]"
        };
        Setting<std::vector<std::string>> exclude_columns_with {
            { "stations", "exclude_columns_with" },
            {},
            "drop columns whose name contains any of these, e.g.\n"
            "quality_code"
        };
    } stations;

    struct
    {
        Setting<std::string> lst_variable {
            { "satellite", "lst_variable" },
            "LST_Day_1km",
            "land surface temperature, dimensions (time, y, x)"
        };
        Setting<std::string> time_variable {
            { "satellite", "time_variable" },
            "time",
            "time coordinate of a prepared grid, seconds since\n"
            "1970-01-01T00:00:00Z"
        };
        Setting<std::string> view_time_variable {
            { "satellite", "view_time_variable" },
            {},
            "view time band (hour of day). If set, the input is a raw\n"
            "scene stack whose scene times are derived from this band."
        };
        Setting<std::string> view_angle_variable {
            { "satellite", "view_angle_variable" },
            "Day_view_angl",
            "view angle band of a raw scene stack"
        };
        Setting<std::string> start_date_variable {
            { "satellite", "start_date_variable" },
            "start_date",
            "acquisition start of each scene of a raw scene stack"
        };
        Setting<std::optional<double>> max_view_angle {
            { "satellite", "max_view_angle" },
            "pixels whose zenith angle exceeds this (deg) count as bad.\n"
            "Leave empty to disable the view angle filter."
        };
        Setting<double> view_angle_offset {
            { "satellite", "view_angle_offset" },
            -65.0,
            "zenith angle = |view angle + view_angle_offset|"
        };
        Setting<double> max_bad_angle_ratio {
            { "satellite", "max_bad_angle_ratio" },
            0.1,
            "scenes are kept if the fraction of bad pixels is below this"
        };
    } satellite;

    struct
    {
        Setting<std::string> stations { { "io_files", "stations" },
                                        {},
                                        "station observations, delimited "
                                        "text" };
        Setting<std::string> satellite { { "io_files", "satellite" },
                                         {},
                                         "satellite LST, NetCDF" };
        Setting<std::string> matchup { { "io_files", "matchup" },
                                       {},
                                       "output matchup product, NetCDF" };
    } io_files;

    SettingsMatchup() = default;
    SettingsMatchup(const std::string& yaml_file) : Settings { yaml_file } {}
    auto scanKeys() -> void override;

    // Parameters regrouped for the processing functions
    [[nodiscard]] auto stationFormat() const -> StationFormat;
    [[nodiscard]] auto matchupOptions() const -> MatchupOptions;
    [[nodiscard]] auto satelliteLayout() const -> SatelliteLayout;
    [[nodiscard]] auto viewAngleFilter() const
      -> std::optional<ViewAngleFilter>;

    ~SettingsMatchup() = default;
};

} // namespace lstmatch
