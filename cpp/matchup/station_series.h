// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Column oriented table holding the observations of one station.
// Each column is either numeric, text or a timestamp column. Row i of
// the table is row i of every column.

#pragma once

#include <common/eigen.h>

#include <cstdint>
#include <string>
#include <vector>

namespace lstmatch {

enum class ColumnType
{
    numeric,
    text,
    time,
};

[[nodiscard]] auto columnTypeToString(const ColumnType type) -> std::string;

struct Column
{
    std::string name {};
    ColumnType type { ColumnType::numeric };
    // Only the container corresponding to type is used. Missing
    // numeric values are NaN, missing text is an empty string.
    Eigen::ArrayXd numbers {};
    std::vector<std::string> text {};
    std::vector<int64_t> times {};

    [[nodiscard]] auto size() const -> int;
    // New column of the same name and type made of the given rows
    [[nodiscard]] auto take(const std::vector<int>& rows) const -> Column;
};

// Names of the columns the matchup needs from every station series
struct StationSchema
{
    std::string time_column { "datetime" };
    std::string latitude_column { "latitude" };
    std::string longitude_column { "longitude" };
};

struct StationSeries
{
    // Station identifier, used for reporting
    std::string station {};
    std::vector<Column> columns {};

    // Number of rows, 0 if there are no columns
    [[nodiscard]] auto size() const -> int;
    // Return the column or nullptr if not present
    [[nodiscard]] auto find(const std::string& name) const -> const Column*;
    // Return the column, throw if it is missing or has the wrong type
    [[nodiscard]] auto column(const std::string& name,
                              const ColumnType type) const -> const Column&;
    [[nodiscard]] auto take(const std::vector<int>& rows) const
      -> StationSeries;
};

// Check that the time, latitude and longitude columns are present
// with the right types, all columns have the same length, and the
// timestamps are strictly increasing. Throws std::invalid_argument
// otherwise.
auto validateSeries(const StationSeries& series,
                    const StationSchema& schema) -> void;

// Remove rows whose timestamp is outside [t_first, t_last]
[[nodiscard]] auto restrictToTimeSpan(const StationSeries& series,
                                      const std::string& time_column,
                                      const int64_t t_first,
                                      const int64_t t_last) -> StationSeries;

} // namespace lstmatch
