// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "product_io.h"

#include <common/io.h>
#include <common/time.h>
#include <netcdf>
#include <numeric>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace lstmatch {

constexpr int compression_level { 5 };
constexpr const char* time_units { "seconds since 1970-01-01T00:00:00Z" };

constexpr const char* description {
    "Station observations matched with satellite land surface\n"
    "temperature (LST). Each pair consists of a station observation\n"
    "whose nearest satellite overpass lies within the match tolerance\n"
    "(matched_time, matched_value) and the station observation\n"
    "immediately before it. Columns of the previous observation carry\n"
    "a suffix. The previous observation is only used if its own\n"
    "nearest satellite overpass lies within the lookback tolerance.\n"
    "The pairs allow relating the station temperature to LST and\n"
    "converting station time series to LST."
};

// Strings to pass to NetCDF for a string variable
static auto cStrings(const std::vector<std::string>& strings)
  -> std::vector<const char*>
{
    std::vector<const char*> ptrs {};
    ptrs.reserve(strings.size());
    for (const auto& str : strings) {
        ptrs.push_back(str.c_str());
    }
    return ptrs;
}

// Concatenate one column over all tables
static auto concatenate(const std::vector<PairedTable>& tables,
                        const size_t i_col,
                        const int n_pairs) -> Column
{
    const Column& first { tables.front().columns[i_col] };
    Column col { .name = first.name, .type = first.type };
    if (col.type == ColumnType::numeric) {
        col.numbers.resize(n_pairs);
    }
    int offset {};
    for (const auto& table : tables) {
        const Column& part { table.columns.at(i_col) };
        if (part.name != col.name || part.type != col.type) {
            throw std::runtime_error { "station " + table.station
                                       + " has different columns than "
                                       + tables.front().station };
        }
        switch (col.type) {
        case ColumnType::numeric:
            col.numbers.segment(offset, part.size()) = part.numbers;
            break;
        case ColumnType::text:
            col.text.insert(col.text.end(), part.text.begin(), part.text.end());
            break;
        case ColumnType::time:
            col.times.insert(
              col.times.end(), part.times.begin(), part.times.end());
            break;
        }
        offset += part.size();
    }
    return col;
}

auto writeMatchup(const std::string& filename,
                  const std::string& config,
                  const MatchupResult& result,
                  const bool compress,
                  const int argc,
                  const char* const argv[]) -> void
{
    netCDF::NcFile nc { filename, netCDF::NcFile::replace };

    // Global attributes
    nc.putAtt("Conventions", "CF-1.11");
    nc.putAtt("title", "Station observations matched with satellite LST");
    nc.putAtt("product_name", filename);
    nc.putAtt("date_created", getDateAndTime());
    if (std::string { LSTMATCH_GIT_COMMIT_ABBREV } != "GITDIR-N") {
        nc.putAtt("git_commit", LSTMATCH_GIT_COMMIT_ABBREV);
    }
    std::string command_line { argc > 0 ? argv[0] : "" };
    for (int i { 1 }; i < argc; ++i) {
        command_line = command_line + ' ' + argv[i];
    }
    nc.putAtt("history", command_line);
    const YAML::Node yaml_config { YAML::Load(config) };
    if (yaml_config["processing_version"]) {
        nc.putAtt("processing_version",
                  yaml_config["processing_version"].as<std::string>());
    }
    nc.putAtt("description", description);

    auto nc_var { nc.addVar("configuration", netCDF::ncString) };
    nc_var.putAtt("comment",
                  "configuration parameters used for producing this file");
    const char* conf_char { config.c_str() };
    nc_var.putVar(&conf_char);

    // Tables with at least one pair define the columns
    std::vector<PairedTable> tables {};
    for (const auto& table : result.pairs) {
        if (table.size() > 0) {
            tables.push_back(table);
        }
    }
    const int n_pairs { result.nPairs() };
    const auto nc_pair { nc.addDim("pair", static_cast<size_t>(n_pairs)) };
    const bool do_compress { compress && n_pairs > 0 };

    std::vector<std::string> stations {};
    std::vector<int64_t> matched_time {};
    Eigen::ArrayXd matched_value(n_pairs);
    for (int offset {}; const auto& table : tables) {
        stations.insert(
          stations.end(), static_cast<size_t>(table.size()), table.station);
        matched_time.insert(matched_time.end(),
                            table.matched_time.begin(),
                            table.matched_time.end());
        matched_value.segment(offset, table.size()) = table.matched_value;
        offset += table.size();
    }

    nc_var = nc.addVar("station", netCDF::ncString, { nc_pair });
    nc_var.putAtt("long_name", "station identifier");
    if (n_pairs > 0) {
        nc_var.putVar(cStrings(stations).data());
    }

    nc_var = nc.addVar("matched_time", netCDF::ncInt64, { nc_pair });
    nc_var.putAtt("long_name", "time of the matched satellite overpass");
    nc_var.putAtt("units", time_units);
    if (n_pairs > 0) {
        nc_var.putVar(matched_time.data());
    }

    nc_var = nc.addVar("matched_value", netCDF::ncDouble, { nc_pair });
    nc_var.putAtt("long_name", "satellite land surface temperature");
    if (do_compress) {
        nc_var.setCompression(true, true, compression_level);
    }
    if (n_pairs > 0) {
        nc_var.putVar(matched_value.data());
    }

    // Station columns
    std::string column_order {};
    const size_t n_columns { tables.empty() ? 0
                                            : tables.front().columns.size() };
    for (size_t i_col {}; i_col < n_columns; ++i_col) {
        const Column col { concatenate(tables, i_col, n_pairs) };
        if (!nc.getVar(col.name).isNull()) {
            throw std::runtime_error { "station column " + col.name
                                       + " clashes with another variable" };
        }
        column_order += (i_col == 0 ? "" : " ") + col.name;
        switch (col.type) {
        case ColumnType::numeric:
            nc_var = nc.addVar(col.name, netCDF::ncDouble, { nc_pair });
            if (do_compress) {
                nc_var.setCompression(true, true, compression_level);
            }
            nc_var.putVar(col.numbers.data());
            break;
        case ColumnType::text:
            nc_var = nc.addVar(col.name, netCDF::ncString, { nc_pair });
            nc_var.putVar(cStrings(col.text).data());
            break;
        case ColumnType::time:
            nc_var = nc.addVar(col.name, netCDF::ncInt64, { nc_pair });
            nc_var.putAtt("units", time_units);
            nc_var.putVar(col.times.data());
            break;
        }
        nc_var.putAtt("column_type", columnTypeToString(col.type));
    }
    nc.putAtt("columns", column_order);

    // Stations that could not be processed
    auto nc_grp { nc.addGroup("failures") };
    const auto nc_failure { nc_grp.addDim("failure", result.failures.size()) };
    std::vector<std::string> failed_stations {};
    std::vector<std::string> reasons {};
    for (const auto& failure : result.failures) {
        failed_stations.push_back(failure.station);
        reasons.push_back(failure.reason);
    }
    nc_var = nc_grp.addVar("station", netCDF::ncString, { nc_failure });
    nc_var.putAtt("long_name", "station that could not be processed");
    if (!failed_stations.empty()) {
        nc_var.putVar(cStrings(failed_stations).data());
    }
    nc_var = nc_grp.addVar("reason", netCDF::ncString, { nc_failure });
    if (!reasons.empty()) {
        nc_var.putVar(cStrings(reasons).data());
    }
    spdlog::info("Wrote {} pairs of {} stations to {}",
                 n_pairs,
                 tables.size(),
                 filename);
}

// Read a 1D string variable
static auto readStrings(const netCDF::NcVar& nc_var,
                        const size_t n) -> std::vector<std::string>
{
    std::vector<std::string> strings {};
    if (n == 0) {
        return strings;
    }
    std::vector<char*> buf(n);
    nc_var.getVar(buf.data());
    strings.assign(buf.begin(), buf.end());
    nc_free_string(n, buf.data());
    return strings;
}

auto readMatchup(const std::string& filename) -> MatchupResult
{
    const netCDF::NcFile nc { filename, netCDF::NcFile::read };
    const auto n_pairs { nc.getDim("pair").getSize() };
    const auto stations { readStrings(nc.getVar("station"), n_pairs) };
    std::vector<int64_t> matched_time(n_pairs);
    Eigen::ArrayXd matched_value(n_pairs);
    if (n_pairs > 0) {
        nc.getVar("matched_time").getVar(matched_time.data());
        nc.getVar("matched_value").getVar(matched_value.data());
    }

    std::string column_order {};
    nc.getAtt("columns").getValues(column_order);
    std::vector<Column> columns {};
    for (const auto& name : splitString(column_order, ' ')) {
        const auto nc_var { nc.getVar(name) };
        std::string type {};
        nc_var.getAtt("column_type").getValues(type);
        Column col { .name = name };
        if (type == "numeric") {
            col.type = ColumnType::numeric;
            col.numbers.resize(static_cast<int>(n_pairs));
            if (n_pairs > 0) {
                nc_var.getVar(col.numbers.data());
            }
        } else if (type == "text") {
            col.type = ColumnType::text;
            col.text = readStrings(nc_var, n_pairs);
        } else if (type == "time") {
            col.type = ColumnType::time;
            col.times.resize(n_pairs);
            if (n_pairs > 0) {
                nc_var.getVar(col.times.data());
            }
        } else {
            throw std::runtime_error { "unknown column type " + type + " of "
                                       + name };
        }
        columns.push_back(std::move(col));
    }

    // Consecutive pairs of the same station form one table
    MatchupResult result {};
    for (int begin {}; begin < static_cast<int>(n_pairs);) {
        int end { begin + 1 };
        while (end < static_cast<int>(n_pairs)
               && stations[end] == stations[begin]) {
            ++end;
        }
        std::vector<int> rows(end - begin);
        std::iota(rows.begin(), rows.end(), begin);
        PairedTable table { .station = stations[begin],
                            .matched_value = matched_value.segment(begin,
                                                                   end - begin),
                            .matched_time = { matched_time.begin() + begin,
                                              matched_time.begin() + end } };
        for (const auto& col : columns) {
            table.columns.push_back(col.take(rows));
        }
        result.pairs.push_back(std::move(table));
        begin = end;
    }

    const auto nc_grp { nc.getGroup("failures") };
    const auto n_failures { nc_grp.getDim("failure").getSize() };
    const auto failed { readStrings(nc_grp.getVar("station"), n_failures) };
    const auto reasons { readStrings(nc_grp.getVar("reason"), n_failures) };
    for (size_t i {}; i < n_failures; ++i) {
        result.failures.push_back({ failed[i], reasons[i] });
    }
    return result;
}

} // namespace lstmatch
