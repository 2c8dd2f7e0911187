// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "station_io.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <common/constants.h>
#include <common/io.h>
#include <common/time.h>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <map>
#include <numeric>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace lstmatch {

auto parseFilter(const std::vector<std::string>& entry) -> StationFilter
{
    if (entry.size() != 3) {
        throw std::invalid_argument {
            "station filter must have the form [column, operator, value]"
        };
    }
    static const std::map<std::string, FilterOp> operators {
        { "<", FilterOp::less },     { "<=", FilterOp::less_equal },
        { ">", FilterOp::greater },  { ">=", FilterOp::greater_equal },
        { "==", FilterOp::equal },   { "!=", FilterOp::not_equal },
    };
    const auto it { operators.find(trim(entry[1])) };
    if (it == operators.end()) {
        throw std::invalid_argument { "unknown station filter operator: "
                                      + entry[1] };
    }
    return { normalizeName(entry[0]), it->second, trim(entry[2]) };
}

auto splitDelimited(const std::string& line,
                    const char delimiter) -> std::vector<std::string>
{
    std::vector<std::string> fields {};
    std::string field {};
    bool in_quotes { false };
    for (size_t i {}; i < line.size(); ++i) {
        const char c { line[i] };
        if (in_quotes) {
            if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
                field += '"';
                ++i;
            } else if (c == '"') {
                in_quotes = false;
            } else {
                field += c;
            }
        } else if (c == '"') {
            in_quotes = true;
        } else if (c == delimiter) {
            fields.push_back(field);
            field.clear();
        } else if (c != '\r') {
            field += c;
        }
    }
    fields.push_back(field);
    return fields;
}

// Parse a whole cell as a number. Empty cells are NaN.
static auto parseNumber(const std::string& cell, double& value) -> bool
{
    const std::string str { trim(cell) };
    if (str.empty()) {
        value = fill::nan;
        return true;
    }
    char* end {};
    value = std::strtod(str.c_str(), &end);
    return end == str.c_str() + str.size();
}

// Make a numeric column if all cells are numbers, else a text column.
// A forced numeric column stores cells that are not numbers as NaN.
static auto makeColumn(const std::string& name,
                       const std::vector<std::string>& cells,
                       const std::optional<ColumnType> forced_type) -> Column
{
    Column col { .name = name };
    if (forced_type != ColumnType::text) {
        col.numbers.resize(static_cast<int>(cells.size()));
        bool all_numbers { true };
        for (int i {}; i < static_cast<int>(cells.size()); ++i) {
            if (!parseNumber(cells[i], col.numbers(i))) {
                col.numbers(i) = fill::nan;
                all_numbers = false;
                if (!forced_type) {
                    break;
                }
            }
        }
        if (all_numbers || forced_type == ColumnType::numeric) {
            col.type = ColumnType::numeric;
            return col;
        }
        col.numbers.resize(0);
    }
    col.type = ColumnType::text;
    col.text.reserve(cells.size());
    for (const auto& cell : cells) {
        col.text.push_back(trim(cell));
    }
    return col;
}

static auto compare(const double a, const FilterOp op, const double b) -> bool
{
    switch (op) {
    case FilterOp::less:
        return a < b;
    case FilterOp::less_equal:
        return a <= b;
    case FilterOp::greater:
        return a > b;
    case FilterOp::greater_equal:
        return a >= b;
    case FilterOp::equal:
        return a == b;
    case FilterOp::not_equal:
        return !std::isnan(a) && a != b;
    default:
        throw std::invalid_argument { "invalid filter operator" };
    }
}

// Rows of the table that pass all filters
static auto applyFilters(const StationSeries& table,
                         const std::vector<StationFilter>& filters)
  -> std::vector<int>
{
    std::vector<int> rows(table.size());
    std::iota(rows.begin(), rows.end(), 0);
    for (const auto& filter : filters) {
        const Column* col { table.find(filter.column) };
        if (col == nullptr) {
            throw std::invalid_argument { "station filter column not found: "
                                          + filter.column };
        }
        std::vector<int> kept {};
        if (col->type == ColumnType::numeric) {
            double value {};
            if (!parseNumber(filter.value, value) || std::isnan(value)) {
                throw std::invalid_argument { "station filter on "
                                              + filter.column
                                              + " needs a number, got "
                                              + filter.value };
            }
            std::ranges::copy_if(rows, std::back_inserter(kept), [&](int row) {
                return compare(col->numbers(row), filter.op, value);
            });
        } else {
            if (filter.op != FilterOp::equal
                && filter.op != FilterOp::not_equal) {
                throw std::invalid_argument {
                    "only == and != filters are supported for text column "
                    + filter.column
                };
            }
            std::ranges::copy_if(rows, std::back_inserter(kept), [&](int row) {
                return (col->text[row] == filter.value)
                       == (filter.op == FilterOp::equal);
            });
        }
        spdlog::info("Filter {}: {} of {} rows kept",
                     filter.column,
                     kept.size(),
                     rows.size());
        rows = std::move(kept);
    }
    return rows;
}

// Largest magnitude accepted for month, day, hour, minute and second
// before the range check of toTimestamp
constexpr double max_date_field { 1e4 };

// Assemble timestamps from the date columns. Rows with a missing or
// invalid date get no value. A single date column holds ISO 8601
// text, several columns hold year, month, day, hour, minute and
// second as numbers.
static auto assembleTimes(const StationSeries& table,
                          const std::vector<std::string>& datetime_columns)
  -> std::vector<std::optional<int64_t>>
{
    std::vector<std::optional<int64_t>> times(table.size());
    if (datetime_columns.size() == 1) {
        const auto& text {
            table.column(normalizeName(datetime_columns.front()),
                         ColumnType::text)
              .text
        };
        for (int row {}; row < table.size(); ++row) {
            times[row] = parseTimestamp(text[row]);
        }
        return times;
    }
    if (datetime_columns.size() < 3 || datetime_columns.size() > 6) {
        throw std::invalid_argument {
            "datetime columns must be one ISO 8601 column or list year, "
            "month, day and optionally hour, minute and second"
        };
    }
    std::vector<const Column*> cols {};
    for (const auto& name : datetime_columns) {
        cols.push_back(&table.column(normalizeName(name), ColumnType::numeric));
    }
    for (int row {}; row < table.size(); ++row) {
        // year, month, day, hour, minute, second
        std::array<int, 6> fields {};
        bool valid { true };
        for (size_t i {}; i < cols.size() && valid; ++i) {
            const double value { cols[i]->numbers(row) };
            const double limit { i == 0 ? static_cast<double>(max_year)
                                        : max_date_field };
            valid = std::isfinite(value) && value == std::floor(value)
                    && std::abs(value) <= limit;
            fields[i] = valid ? static_cast<int>(value) : 0;
        }
        if (valid) {
            times[row] = toTimestamp(fields[0],
                                     fields[1],
                                     fields[2],
                                     fields[3],
                                     fields[4],
                                     fields[5]);
        }
    }
    return times;
}

auto parseStationTable(std::istream& in,
                       const StationFormat& format) -> StationSeries
{
    std::string line {};
    if (!std::getline(in, line)) {
        throw std::runtime_error { "station file is empty" };
    }
    std::vector<std::string> names {};
    for (const auto& field : splitDelimited(line, format.delimiter)) {
        names.push_back(normalizeName(field));
    }
    for (size_t i {}; i < names.size(); ++i) {
        if (std::find(names.begin() + static_cast<long>(i) + 1,
                      names.end(),
                      names[i])
            != names.end()) {
            throw std::invalid_argument { "duplicate station column: "
                                          + names[i] };
        }
    }

    // Cells per column
    std::vector<std::vector<std::string>> cells(names.size());
    int line_nr { 1 };
    while (std::getline(in, line)) {
        ++line_nr;
        if (trim(line).empty()) {
            continue;
        }
        const auto fields { splitDelimited(line, format.delimiter) };
        if (fields.size() != names.size()) {
            throw std::invalid_argument {
                "station file line " + std::to_string(line_nr) + " has "
                + std::to_string(fields.size()) + " fields, expected "
                + std::to_string(names.size())
            };
        }
        for (size_t i {}; i < fields.size(); ++i) {
            cells[i].push_back(fields[i]);
        }
    }

    // The station column is always text. Date columns have a fixed
    // type so that a bad cell only invalidates its own row.
    const std::string station_column { normalizeName(format.station_column) };
    const ColumnType date_type { format.datetime_columns.size() == 1
                                   ? ColumnType::text
                                   : ColumnType::numeric };
    StationSeries table {};
    for (size_t i {}; i < names.size(); ++i) {
        std::optional<ColumnType> forced_type {};
        if (names[i] == station_column) {
            forced_type = ColumnType::text;
        } else if (std::ranges::any_of(format.datetime_columns,
                                       [&](const std::string& name) {
                                           return normalizeName(name)
                                                  == names[i];
                                       })) {
            forced_type = date_type;
        }
        table.columns.push_back(makeColumn(names[i], cells[i], forced_type));
    }
    const int n_read { table.size() };
    table = table.take(applyFilters(table, format.filters));

    // Replace the date columns by a single timestamp column
    const auto times { assembleTimes(table, format.datetime_columns) };
    std::vector<int> rows {};
    Column time_col { .name = normalizeName(format.time_column),
                      .type = ColumnType::time };
    for (int row {}; row < static_cast<int>(times.size()); ++row) {
        if (times[row]) {
            rows.push_back(row);
            time_col.times.push_back(times[row].value());
        }
    }
    if (static_cast<int>(rows.size()) < table.size()) {
        spdlog::warn("Dropped {} station rows with an invalid date",
                     table.size() - static_cast<int>(rows.size()));
    }
    StationSeries result {};
    result.columns.push_back(std::move(time_col));
    for (const Column& col : table.columns) {
        const bool is_date_column { std::ranges::any_of(
          format.datetime_columns,
          [&](const std::string& name) {
              return normalizeName(name) == col.name;
          }) };
        const bool is_excluded { std::ranges::any_of(
          format.exclude_columns_with, [&](const std::string& pattern) {
              return col.name != station_column
                     && col.name.find(normalizeName(pattern))
                          != std::string::npos;
          }) };
        if (is_date_column || is_excluded) {
            continue;
        }
        if (col.name == result.columns.front().name) {
            throw std::invalid_argument { "station file already has a column "
                                          + col.name };
        }
        result.columns.push_back(col.take(rows));
    }
    spdlog::info("Station rows: {} read, {} kept", n_read, rows.size());
    return result;
}

auto splitByStation(const StationSeries& table,
                    const StationFormat& format) -> std::vector<StationSeries>
{
    const std::string station_column { normalizeName(format.station_column) };
    const std::string time_column { normalizeName(format.time_column) };
    const auto& stations { table.column(station_column, ColumnType::text)
                             .text };
    const auto& times { table.column(time_column, ColumnType::time).times };
    std::map<std::string, std::vector<int>> groups {};
    for (int row {}; row < static_cast<int>(stations.size()); ++row) {
        groups[stations[row]].push_back(row);
    }
    std::vector<StationSeries> series {};
    series.reserve(groups.size());
    for (auto& [station, rows] : groups) {
        std::ranges::stable_sort(
          rows, [&](const int a, const int b) { return times[a] < times[b]; });
        StationSeries group { .station = station };
        for (const Column& col : table.columns) {
            if (col.name != station_column) {
                group.columns.push_back(col.take(rows));
            }
        }
        series.push_back(std::move(group));
    }
    return series;
}

auto readStations(const std::string& filename,
                  const StationFormat& format) -> std::vector<StationSeries>
{
    std::ifstream in { filename };
    if (!in) {
        throw std::runtime_error { "could not open station file " + filename };
    }
    const auto stations { splitByStation(parseStationTable(in, format),
                                         format) };
    spdlog::info("Number of stations: {}", stations.size());
    return stations;
}

} // namespace lstmatch
