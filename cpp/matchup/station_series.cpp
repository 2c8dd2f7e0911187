// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "station_series.h"

#include <cmath>
#include <common/time.h>
#include <stdexcept>

namespace lstmatch {

auto columnTypeToString(const ColumnType type) -> std::string
{
    switch (type) {
    case ColumnType::numeric:
        return "numeric";
    case ColumnType::text:
        return "text";
    case ColumnType::time:
        return "time";
    default:
        throw std::invalid_argument { "invalid column type" };
    }
}

auto Column::size() const -> int
{
    switch (type) {
    case ColumnType::numeric:
        return static_cast<int>(numbers.size());
    case ColumnType::text:
        return static_cast<int>(text.size());
    case ColumnType::time:
        return static_cast<int>(times.size());
    default:
        throw std::invalid_argument { "invalid column type" };
    }
}

auto Column::take(const std::vector<int>& rows) const -> Column
{
    Column result { .name = name, .type = type };
    const int n { static_cast<int>(rows.size()) };
    switch (type) {
    case ColumnType::numeric:
        result.numbers.resize(n);
        for (int i {}; i < n; ++i) {
            result.numbers(i) = numbers(rows[i]);
        }
        break;
    case ColumnType::text:
        result.text.reserve(n);
        for (const int row : rows) {
            result.text.push_back(text.at(row));
        }
        break;
    case ColumnType::time:
        result.times.reserve(n);
        for (const int row : rows) {
            result.times.push_back(times.at(row));
        }
        break;
    }
    return result;
}

auto StationSeries::size() const -> int
{
    return columns.empty() ? 0 : columns.front().size();
}

auto StationSeries::find(const std::string& name) const -> const Column*
{
    for (const Column& col : columns) {
        if (col.name == name) {
            return &col;
        }
    }
    return nullptr;
}

auto StationSeries::column(const std::string& name,
                           const ColumnType type) const -> const Column&
{
    const Column* col { find(name) };
    if (col == nullptr) {
        throw std::invalid_argument { "missing column " + name };
    }
    if (col->type != type) {
        throw std::invalid_argument { "column " + name + " is "
                                      + columnTypeToString(col->type)
                                      + ", expected "
                                      + columnTypeToString(type) };
    }
    return *col;
}

auto StationSeries::take(const std::vector<int>& rows) const -> StationSeries
{
    StationSeries result { .station = station };
    result.columns.reserve(columns.size());
    for (const Column& col : columns) {
        result.columns.push_back(col.take(rows));
    }
    return result;
}

auto validateSeries(const StationSeries& series,
                    const StationSchema& schema) -> void
{
    const auto& times { series.column(schema.time_column, ColumnType::time)
                          .times };
    const auto& lat { series.column(schema.latitude_column, ColumnType::numeric)
                        .numbers };
    const auto& lon {
        series.column(schema.longitude_column, ColumnType::numeric).numbers
    };
    for (const Column& col : series.columns) {
        if (col.size() != static_cast<int>(times.size())) {
            throw std::invalid_argument {
                "column " + col.name + " has " + std::to_string(col.size())
                + " rows, expected " + std::to_string(times.size())
            };
        }
    }
    // A position without a value has no nearest grid cell
    for (int i {}; i < static_cast<int>(times.size()); ++i) {
        if (!std::isfinite(lat(i)) || !std::isfinite(lon(i))) {
            throw std::invalid_argument { "no valid position at "
                                          + formatTimestamp(times[i]) };
        }
    }
    for (size_t i { 1 }; i < times.size(); ++i) {
        if (times[i] == times[i - 1]) {
            throw std::invalid_argument { "duplicate timestamp "
                                          + formatTimestamp(times[i]) };
        }
        if (times[i] < times[i - 1]) {
            throw std::invalid_argument { "timestamps not increasing at "
                                          + formatTimestamp(times[i]) };
        }
    }
}

auto restrictToTimeSpan(const StationSeries& series,
                        const std::string& time_column,
                        const int64_t t_first,
                        const int64_t t_last) -> StationSeries
{
    const auto& times { series.column(time_column, ColumnType::time).times };
    std::vector<int> rows {};
    for (int i {}; i < static_cast<int>(times.size()); ++i) {
        if (times[i] >= t_first && times[i] <= t_last) {
            rows.push_back(i);
        }
    }
    return series.take(rows);
}

} // namespace lstmatch
