// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Reading station observations from delimited text. The file has a
// header row and one observation per line, observations of all
// stations mixed. Column names are normalized with normalizeName.

#pragma once

#include "station_series.h"

#include <istream>
#include <optional>

namespace lstmatch {

enum class FilterOp
{
    less,
    less_equal,
    greater,
    greater_equal,
    equal,
    not_equal,
};

// Keep only rows where <column> <op> <value> holds
struct StationFilter
{
    std::string column {};
    FilterOp op { FilterOp::equal };
    std::string value {};
};

// Convert a configuration entry [column, op, value] to a filter.
// Throws std::invalid_argument for an unknown operator or the wrong
// number of entries.
[[nodiscard]] auto parseFilter(const std::vector<std::string>& entry)
  -> StationFilter;

struct StationFormat
{
    char delimiter { ',' };
    // Column identifying the station. It is removed from the table and
    // becomes StationSeries::station.
    std::string station_column { "station_name" };
    // Name of the assembled timestamp column
    std::string time_column { "datetime" };
    // Columns holding year, month, day and optionally hour, minute
    // and second, in this order, or one column of ISO 8601
    // timestamps. They are removed after assembling the timestamp.
    std::vector<std::string> datetime_columns { "year",
                                                "month",
                                                "day",
                                                "hour",
                                                "minute" };
    std::vector<StationFilter> filters {};
    // Columns whose name contains one of these are dropped
    std::vector<std::string> exclude_columns_with {};
};

// Split a line at the delimiter. Fields may be enclosed in double
// quotes, in which case the delimiter is taken literally and ""
// stands for one quote.
[[nodiscard]] auto splitDelimited(const std::string& line,
                                  const char delimiter)
  -> std::vector<std::string>;

// Parse the whole table. Filters are applied before the timestamp is
// assembled so that they may refer to the date columns. Rows with an
// invalid date are dropped. A column is numeric if every non-empty
// cell is a number, otherwise text.
[[nodiscard]] auto parseStationTable(std::istream& in,
                                     const StationFormat& format)
  -> StationSeries;

// Split a table into one series per station, ordered by station name.
// Each series is sorted by time. Rows keep their relative order for
// equal timestamps, so duplicates remain to be caught by
// validateSeries.
[[nodiscard]] auto splitByStation(const StationSeries& table,
                                  const StationFormat& format)
  -> std::vector<StationSeries>;

[[nodiscard]] auto readStations(const std::string& filename,
                                const StationFormat& format)
  -> std::vector<StationSeries>;

} // namespace lstmatch
