// Unit tests for the matchup processor

#include "../testing.h"

#include <common/algorithm.h>
#include <matchup/grid_io.h>
#include <matchup/matchup.h>
#include <matchup/selector.h>
#include <matchup/settings_matchup.h>
#include <matchup/station_io.h>
#include <numbers>
#include <random>
#include <sstream>

using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

const std::string tmp_dir { std::filesystem::temp_directory_path() };

TEST_CASE("time")
{
    SECTION("Calendar conversion")
    {
        CHECK(lstmatch::toTimestamp(1970, 1, 1) == 0);
        CHECK(lstmatch::toTimestamp(2000, 3, 1) == 951868800);
        CHECK(lstmatch::toTimestamp(2020, 1, 2, 3, 4, 5) == 1577934245);
        CHECK(lstmatch::toTimestamp(1969, 12, 31, 23) == -3600);
        CHECK(lstmatch::toTimestamp(2024, 2, 29).has_value());
        CHECK_FALSE(lstmatch::toTimestamp(2023, 2, 29).has_value());
        CHECK_FALSE(lstmatch::toTimestamp(2023, 4, 31).has_value());
        CHECK_FALSE(lstmatch::toTimestamp(2023, 13, 1).has_value());
        CHECK_FALSE(lstmatch::toTimestamp(2023, 1, 1, 24).has_value());
        CHECK(lstmatch::toTimestamp(9999, 12, 31).has_value());
        CHECK_FALSE(lstmatch::toTimestamp(0, 1, 1).has_value());
        CHECK_FALSE(lstmatch::toTimestamp(100000, 1, 1).has_value());
    }

    SECTION("Parsing and formatting")
    {
        CHECK(lstmatch::parseTimestamp("2020-01-02T03:04:05Z") == 1577934245);
        CHECK(lstmatch::parseTimestamp("2020-01-02 03:04:05") == 1577934245);
        CHECK(lstmatch::parseTimestamp("2020-01-02T03:04") == 1577934240);
        CHECK(lstmatch::parseTimestamp("2020-01-02") == t_2020 + 86400);
        CHECK_FALSE(lstmatch::parseTimestamp("2020-01-02T03").has_value());
        CHECK_FALSE(lstmatch::parseTimestamp("yesterday").has_value());
        CHECK(lstmatch::formatTimestamp(1577934245) == "2020-01-02T03:04:05Z");
        CHECK(lstmatch::formatTimestamp(-1) == "1969-12-31T23:59:59Z");
    }

    SECTION("Day floor and hours")
    {
        CHECK(lstmatch::floorToDay(t_2020 + 5 * hour) == t_2020);
        CHECK(lstmatch::floorToDay(-1) == -86400);
        CHECK_THAT(lstmatch::hoursBetween(t_2020, t_2020 + 5400),
                   WithinAbs(-1.5, 1e-12));
    }
}

TEST_CASE("nearest index")
{
    const Eigen::ArrayXd ascending { { 0.0, 1.0, 2.0, 3.0 } };
    const Eigen::ArrayXd descending { { 3.0, 2.0, 1.0, 0.0 } };
    const auto up { lstmatch::Monotonic::increasing };
    const auto down { lstmatch::Monotonic::decreasing };

    SECTION("Monotonicity")
    {
        CHECK(lstmatch::monotonicity(ascending) == up);
        CHECK(lstmatch::monotonicity(descending) == down);
        CHECK(lstmatch::monotonicity(Eigen::ArrayXd { { 0.0, 1.0, 1.0 } })
              == lstmatch::Monotonic::none);
        CHECK(lstmatch::monotonicity(std::vector<int64_t> { 5 }) == up);
    }

    SECTION("Ascending axis")
    {
        CHECK(lstmatch::nearestIdx(ascending, up, 1.4) == 1);
        CHECK(lstmatch::nearestIdx(ascending, up, 1.6) == 2);
        CHECK(lstmatch::nearestIdx(ascending, up, 1.5) == 1);
        CHECK(lstmatch::nearestIdx(ascending, up, -5.0) == 0);
        CHECK(lstmatch::nearestIdx(ascending, up, 10.0) == 3);
        CHECK(lstmatch::nearestIdx(ascending, up, 3.0) == 3);
    }

    SECTION("Descending axis")
    {
        CHECK(lstmatch::nearestIdx(descending, down, 1.5) == 1);
        CHECK(lstmatch::nearestIdx(descending, down, 0.4) == 3);
        CHECK(lstmatch::nearestIdx(descending, down, 2.9) == 0);
        CHECK(lstmatch::nearestIdx(descending, down, 7.0) == 0);
        CHECK(lstmatch::nearestIdx(descending, down, -7.0) == 3);
    }

    SECTION("Time axis ties go to the earliest time")
    {
        const std::vector<int64_t> times { 0, 3600, 7200 };
        CHECK(lstmatch::nearestIdx(times, 1800) == 0);
        CHECK(lstmatch::nearestIdx(times, 1801) == 1);
        CHECK(lstmatch::nearestIdx(times, 5400) == 1);
        CHECK(lstmatch::nearestIdx(times, 100000) == 2);
    }

    SECTION("NaN aware mean")
    {
        CHECK_THAT(lstmatch::nanMean(Eigen::ArrayXd { { 1.0, NAN, 3.0 } }),
                   WithinRel(2.0, 1e-12));
        CHECK(std::isnan(lstmatch::nanMean(Eigen::ArrayXd { { NAN, NAN } })));
    }
}

TEST_CASE("satellite grid")
{
    const std::vector<int64_t> times { t_2020, t_2020 + 6 * hour };
    const Eigen::ArrayXd y { { -33.9, -34.0 } };
    const Eigen::ArrayXd x { { 18.4, 18.5, 18.6 } };
    ArrayXXd values(2, 6);
    values << 1, 2, 3, 4, 5, 6, 11, 12, 13, 14, 15, NAN;
    const lstmatch::GriddedLST grid { times, y, x, values };

    SECTION("Nearest lookup")
    {
        const auto samples { grid.nearest({ { t_2020 + hour, -33.98, 18.41, 0 },
                                            { t_2020 + 5 * hour, -33.0, 99.0, 1 },
                                            { t_2020 + 3 * hour, -34.0, 18.6, 2 },
                                            { t_2020 + 4 * hour, -34.0, 18.6, 3 } }) };
        REQUIRE(samples.size() == 4);
        CHECK(samples[0].value == 4.0);
        CHECK(samples[0].time == t_2020);
        // Clamped to the edges
        CHECK(samples[1].value == 13.0);
        CHECK(samples[1].time == t_2020 + 6 * hour);
        // Halfway in time resolves to the earlier scene
        CHECK(samples[2].value == 6.0);
        CHECK(samples[2].time == t_2020);
        // Missing data is returned as is
        CHECK(std::isnan(samples[3].value));
        CHECK(samples[3].time == t_2020 + 6 * hour);
    }

    SECTION("Invalid grids")
    {
        CHECK_THROWS_AS((lstmatch::GriddedLST {
                          { t_2020 + hour, t_2020 }, y, x, values }),
                        std::invalid_argument);
        CHECK_THROWS_AS(
          (lstmatch::GriddedLST {
            times, Eigen::ArrayXd { { 1.0, 1.0 } }, x, values }),
          std::invalid_argument);
        CHECK_THROWS_AS(
          (lstmatch::GriddedLST { times, y, x, ArrayXXd::Zero(2, 5) }),
          std::invalid_argument);
    }

    SECTION("Resolution")
    {
        const auto resolution { grid.resolutionMetres() };
        CHECK_THAT(resolution[0], WithinAbs(-11100.0, 1e-9));
        CHECK_THAT(resolution[1],
                   WithinAbs(std::nearbyint(
                               11100.0 * std::cos(-33.95 * std::numbers::pi
                                                  / 180.0)),
                             1e-9));
    }
}

TEST_CASE("window classifier")
{
    const lstmatch::WindowTolerances tolerances {};
    const auto classify { [&](const std::vector<double>& offsets,
                              const lstmatch::WindowTolerances& tol) {
        return lstmatch::classifyWindows(
          Eigen::Map<const Eigen::ArrayXd>(offsets.data(),
                                           static_cast<int>(offsets.size())),
          tol);
    } };
    const auto toVector { [](const ArrayXb& mask) {
        return std::vector<bool>(mask.begin(), mask.end());
    } };

    SECTION("Anchor outside match tolerance")
    {
        const auto masks { classify({ 0.0, 2.0, 0.0 }, tolerances) };
        CHECK(toVector(masks.is_current_match)
              == std::vector<bool> { false, false, true });
        CHECK(toVector(masks.is_previous_anchor)
              == std::vector<bool> { false, true, false });
    }

    SECTION("Single observation")
    {
        const auto masks { classify({ 0.0 }, tolerances) };
        CHECK_FALSE(masks.is_current_match(0));
        CHECK_FALSE(masks.is_previous_anchor(0));
    }

    SECTION("Empty series")
    {
        const auto masks { classify({}, tolerances) };
        CHECK(masks.is_current_match.size() == 0);
        CHECK(masks.is_previous_anchor.size() == 0);
    }

    SECTION("Anchor beyond lookback tolerance")
    {
        const auto masks { classify({ 0.8, 0.0 }, { 1.0, 0.5 }) };
        CHECK_FALSE(masks.is_current_match.any());
        CHECK_FALSE(masks.is_previous_anchor.any());
        const auto far { classify({ 5.0, 0.0 }, tolerances) };
        CHECK_FALSE(far.is_current_match.any());
        CHECK_FALSE(far.is_previous_anchor.any());
    }

    SECTION("Boundaries are inclusive")
    {
        auto masks { classify({ 4.0, 1.0 }, tolerances) };
        CHECK(toVector(masks.is_current_match)
              == std::vector<bool> { false, true });
        masks = classify({ -4.0, -1.0 }, tolerances);
        CHECK(toVector(masks.is_current_match)
              == std::vector<bool> { false, true });
        masks = classify({ 4.001, 1.0 }, tolerances);
        CHECK_FALSE(masks.is_current_match.any());
        masks = classify({ 0.0, 1.001 }, tolerances);
        CHECK_FALSE(masks.is_current_match.any());
    }

    SECTION("NaN offsets never match")
    {
        auto masks { classify({ NAN, 0.0 }, tolerances) };
        CHECK_FALSE(masks.is_current_match.any());
        masks = classify({ 0.0, NAN }, tolerances);
        CHECK_FALSE(masks.is_current_match.any());
        CHECK_FALSE(masks.is_previous_anchor.any());
    }

    SECTION("A row can be current match and anchor")
    {
        const auto masks { classify({ 0.0, 0.0, 0.0 }, tolerances) };
        CHECK(toVector(masks.is_current_match)
              == std::vector<bool> { false, true, true });
        CHECK(toVector(masks.is_previous_anchor)
              == std::vector<bool> { true, true, false });
    }

    SECTION("Every current match is preceded by its anchor")
    {
        std::mt19937 gen { 42 };
        std::uniform_real_distribution<double> dist { -6.0, 6.0 };
        std::vector<double> offsets(500);
        for (auto& offset : offsets) {
            offset = dist(gen);
        }
        const auto masks { classify(offsets, tolerances) };
        CHECK(masks.is_current_match.count() > 0);
        CHECK(masks.is_current_match.count()
              == masks.is_previous_anchor.count());
        CHECK_FALSE(masks.is_current_match(0));
        for (int i { 1 }; i < static_cast<int>(offsets.size()); ++i) {
            if (masks.is_current_match(i)) {
                CHECK(std::abs(offsets[i]) <= tolerances.match);
                CHECK(masks.is_previous_anchor(i - 1));
                CHECK(std::abs(offsets[i - 1]) <= tolerances.lookback);
            }
            if (masks.is_previous_anchor(i - 1)) {
                CHECK(masks.is_current_match(i));
            }
        }
    }
}

TEST_CASE("selector and matcher")
{
    lstmatch::StationSeries series { makeSeries(
      "A", { t_2020, t_2020 + hour, t_2020 + 3 * hour }, -34.0, 18.5) };
    const lstmatch::StationSchema schema {};

    SECTION("One key per row")
    {
        const auto keys { lstmatch::selectKeys(series, schema) };
        REQUIRE(keys.size() == 3);
        for (int i {}; i < 3; ++i) {
            CHECK(keys[i].index == i);
            CHECK(keys[i].y == -34.0);
            CHECK(keys[i].x == 18.5);
        }
        CHECK(keys[2].time == t_2020 + 3 * hour);
    }

    SECTION("Keys are sorted by time and scattered back")
    {
        // Unsorted input, as given to the selector directly
        auto& times { series.columns.front().times };
        std::swap(times[0], times[2]);
        const auto keys { lstmatch::selectKeys(series, schema) };
        CHECK(keys[0].index == 2);
        CHECK(keys[2].index == 0);
        FakeGrid grid {};
        grid.query_times = { t_2020, t_2020 + hour, t_2020 + 3 * hour };
        grid.answers = { { 1.0, t_2020 },
                         { 2.0, t_2020 + hour },
                         { 3.0, t_2020 + 3 * hour } };
        const auto samples { lstmatch::matchKeys(grid, keys, 3) };
        CHECK(grid.n_calls == 1);
        CHECK(samples[0].value == 3.0);
        CHECK(samples[1].value == 2.0);
        CHECK(samples[2].value == 1.0);
    }

    SECTION("Broken key indices")
    {
        auto keys { lstmatch::selectKeys(series, schema) };
        keys[1].index = 0;
        FakeGrid grid {};
        grid.query_times = { t_2020, t_2020 + hour, t_2020 + 3 * hour };
        grid.answers.resize(3);
        CHECK_THROWS_AS(lstmatch::matchKeys(grid, keys, 3), std::logic_error);
        CHECK_THROWS_AS(lstmatch::matchKeys(grid, keys, 4), std::logic_error);
    }

    SECTION("Annotations")
    {
        const auto annotations { lstmatch::annotate(
          { t_2020, t_2020 + hour }, { { 5.0, t_2020 + 2 * hour }, { NAN, t_2020 } }) };
        CHECK(annotations.matched_value(0) == 5.0);
        CHECK(std::isnan(annotations.matched_value(1)));
        CHECK(annotations.time_offset_hours(0) == -2.0);
        CHECK(annotations.time_offset_hours(1) == 1.0);
    }
}

TEST_CASE("matching one station")
{
    const std::vector<int64_t> station_times { t_2020,
                                               t_2020 + hour,
                                               t_2020 + 3 * hour };
    const lstmatch::StationSeries series { makeSeries(
      "A", station_times, -34.0, 18.5) };
    // Offsets 0, 2 and 0 hours
    FakeGrid grid {};
    grid.query_times = station_times;
    grid.answers = { { 300.0, t_2020 },
                     { 301.0, t_2020 - hour },
                     { 302.0, t_2020 + 3 * hour } };
    const lstmatch::MatchupOptions options {};

    SECTION("Anchor paired with the following match")
    {
        const auto table { lstmatch::matchStation(grid, series, options) };
        CHECK(grid.n_calls == 1);
        REQUIRE(table.size() == 1);
        CHECK(table.station == "A");
        CHECK(table.matched_value(0) == 302.0);
        CHECK(table.matched_time[0] == t_2020 + 3 * hour);
        std::vector<std::string> names {};
        for (const auto& col : table.columns) {
            names.push_back(col.name);
        }
        CHECK(names
              == std::vector<std::string> { "datetime",
                                            "latitude",
                                            "longitude",
                                            "temperature",
                                            "datetime_prev",
                                            "temperature_prev" });
        CHECK(table.columns[0].times[0] == t_2020 + 3 * hour);
        CHECK(table.columns[3].numbers(0) == 12.0);
        CHECK(table.columns[4].times[0] == t_2020 + hour);
        CHECK(table.columns[5].numbers(0) == 11.0);
    }

    SECTION("Missing grid value drops the pair")
    {
        grid.answers[2].value = NAN;
        const auto table { lstmatch::matchStation(grid, series, options) };
        CHECK(table.size() == 0);
        CHECK(table.columns.size() == 6);
    }

    SECTION("Custom suffix")
    {
        lstmatch::MatchupOptions custom {};
        custom.previous_suffix = "_tm1";
        const auto table { lstmatch::matchStation(grid, series, custom) };
        CHECK(table.columns[5].name == "temperature_tm1");
    }

    SECTION("Single observation")
    {
        const auto single { makeSeries("B", { t_2020 }, -34.0, 18.5) };
        CHECK(lstmatch::matchStation(grid, single, options).size() == 0);
    }

    SECTION("Invalid series")
    {
        auto duplicate { makeSeries(
          "C", { t_2020, t_2020, t_2020 + 3 * hour }, -34.0, 18.5) };
        CHECK_THROWS_AS(lstmatch::matchStation(grid, duplicate, options),
                        std::invalid_argument);
        auto decreasing { makeSeries(
          "D", { t_2020 + hour, t_2020, t_2020 + 3 * hour }, -34.0, 18.5) };
        CHECK_THROWS_AS(lstmatch::matchStation(grid, decreasing, options),
                        std::invalid_argument);
        auto missing { series };
        missing.columns.erase(missing.columns.begin() + 1);
        CHECK_THROWS_AS(lstmatch::matchStation(grid, missing, options),
                        std::invalid_argument);
        auto wrong_type { series };
        wrong_type.columns[2].type = lstmatch::ColumnType::text;
        CHECK_THROWS_AS(lstmatch::matchStation(grid, wrong_type, options),
                        std::invalid_argument);
        const auto no_position { makeSeries(
          "E", { t_2020, t_2020 + hour }, NAN, NAN) };
        CHECK_THROWS_AS(lstmatch::matchStation(grid, no_position, options),
                        std::invalid_argument);
        auto no_longitude { series };
        no_longitude.columns[2].numbers(1) = INFINITY;
        CHECK_THROWS_AS(lstmatch::matchStation(grid, no_longitude, options),
                        std::invalid_argument);
        CHECK(grid.n_calls == 0);
    }
}

TEST_CASE("matching all stations")
{
    const std::vector<int64_t> grid_times { t_2020, t_2020 + 6 * hour };
    const Eigen::ArrayXd y { { -33.9, -34.0 } };
    const Eigen::ArrayXd x { { 18.4, 18.5 } };
    ArrayXXd values(2, 4);
    values << 300, 301, 302, 303, 310, 311, 312, 313;
    const lstmatch::GriddedLST grid { grid_times, y, x, values };
    const lstmatch::MatchupOptions options {};

    std::vector<lstmatch::StationSeries> stations {};
    for (int i {}; i < 20; ++i) {
        stations.push_back(makeSeries(
          "S" + std::to_string(i),
          { t_2020,
            t_2020 + (1 + i % 2) * hour,
            t_2020 + 6 * hour,
            t_2020 + 7 * hour },
          i % 2 == 0 ? -33.9 : -34.0,
          18.5));
    }
    // Station 0 has a duplicate timestamp after the first row
    stations[0].columns[0].times[1] = t_2020;
    stations[5].columns.erase(stations[5].columns.begin());

    SECTION("Failures are isolated")
    {
        const auto result { lstmatch::matchAll(grid, stations, options) };
        REQUIRE(result.failures.size() == 2);
        CHECK(result.failures[0].station == "S0");
        CHECK(result.failures[1].station == "S5");
        CHECK_FALSE(result.failures[1].reason.empty());
        REQUIRE(result.pairs.size() == 18);
        for (size_t i {}, i_station {}; i < result.pairs.size(); ++i) {
            while (i_station == 0 || i_station == 5) {
                ++i_station;
            }
            const auto expected { lstmatch::matchStation(
              grid, stations[i_station], options) };
            CHECK(result.pairs[i].station == stations[i_station].station);
            CHECK(result.pairs[i].matched_time == expected.matched_time);
            CHECK((result.pairs[i].matched_value == expected.matched_value)
                    .all());
            ++i_station;
        }
    }

    SECTION("Stations without a position fail")
    {
        stations[7].columns[1].numbers(2) = NAN;
        const auto result { lstmatch::matchAll(grid, stations, options) };
        REQUIRE(result.failures.size() == 3);
        CHECK(result.failures[2].station == "S7");
        CHECK(result.failures[2].reason.find("position")
              != std::string::npos);
        CHECK(result.pairs.size() == 17);
    }

    SECTION("Pairs of regular stations")
    {
        // Offsets 0, 1, 0, 1 hours: every row after the first matches
        const auto result { lstmatch::matchAll(grid, { stations[2] }, options) };
        REQUIRE(result.pairs.size() == 1);
        CHECK(result.failures.empty());
        CHECK(result.nPairs() == 3);
        const auto& table { result.pairs.front() };
        CHECK(table.matched_time
              == std::vector<int64_t> { t_2020,
                                        t_2020 + 6 * hour,
                                        t_2020 + 6 * hour });
        CHECK(table.matched_value(0) == 301.0);
        CHECK(table.matched_value(2) == 311.0);
        // Offsets 0, 2, 0, 1 hours: the second row is no current match
        const auto other { lstmatch::matchAll(grid, { stations[1] }, options) };
        REQUIRE(other.nPairs() == 2);
        const auto& other_table { other.pairs.front() };
        CHECK(other_table.columns[0].times
              == std::vector<int64_t> { t_2020 + 6 * hour, t_2020 + 7 * hour });
        CHECK(other_table.columns[4].times
              == std::vector<int64_t> { t_2020 + 2 * hour, t_2020 + 6 * hour });
        CHECK(other_table.matched_value(0) == 313.0);
        CHECK(other_table.matched_value(1) == 313.0);
    }
}

TEST_CASE("station series")
{
    const auto series { makeSeries(
      "A", { t_2020, t_2020 + hour, t_2020 + 2 * hour, t_2020 + 3 * hour },
      -34.0,
      18.5) };

    SECTION("Restrict to time span")
    {
        const auto restricted { lstmatch::restrictToTimeSpan(
          series, "datetime", t_2020 + hour, t_2020 + 2 * hour) };
        REQUIRE(restricted.size() == 2);
        CHECK(restricted.station == "A");
        CHECK(restricted.columns[0].times
              == std::vector<int64_t> { t_2020 + hour, t_2020 + 2 * hour });
        CHECK(restricted.columns[3].numbers(0) == 11.0);
    }

    SECTION("Column lookup")
    {
        CHECK(series.find("temperature") != nullptr);
        CHECK(series.find("pressure") == nullptr);
        CHECK_THROWS_AS(
          series.column("temperature", lstmatch::ColumnType::text),
          std::invalid_argument);
    }
}

TEST_CASE("station reading")
{
    lstmatch::StationFormat format {};
    format.filters = { lstmatch::parseFilter({ "Year", ">=", "2020" }) };
    format.exclude_columns_with = { "quality_code" };
    std::istringstream in {
        "Station_name,Year,Month,Day,Hour,Minute,Latitude,Longitude,"
        "temperature,temperature_Quality_Code,Report Type\n"
        "\"B, WC\",2020,1,1,12,0,-33.9,18.4,21.5,1,FM-15\n"
        "A,2020,1,1,13,30,-34.0,18.5,,1,FM-12\n"
        "A,2020,1,1,12,0,-34.0,18.5,20.0,5,FM-15\n"
        "A,2019,12,31,12,0,-34.0,18.5,19.0,1,FM-15\n"
        "A,2020,2,30,12,0,-34.0,18.5,19.5,1,FM-15\n"
        "\n"
    };
    const auto table { lstmatch::parseStationTable(in, format) };

    SECTION("Columns")
    {
        std::vector<std::string> names {};
        for (const auto& col : table.columns) {
            names.push_back(col.name);
        }
        CHECK(names
              == std::vector<std::string> { "datetime",
                                            "station_name",
                                            "latitude",
                                            "longitude",
                                            "temperature",
                                            "report_type" });
        CHECK(table.size() == 3);
        CHECK(table.find("report_type")->type == lstmatch::ColumnType::text);
        CHECK(table.find("temperature")->type
              == lstmatch::ColumnType::numeric);
        CHECK(std::isnan(table.find("temperature")->numbers(1)));
        CHECK(table.columns[0].times[1] == t_2020 + 13 * hour + 1800);
    }

    SECTION("Grouping by station")
    {
        const auto stations { lstmatch::splitByStation(table, format) };
        REQUIRE(stations.size() == 2);
        CHECK(stations[0].station == "A");
        CHECK(stations[1].station == "B, WC");
        CHECK(stations[0].find("station_name") == nullptr);
        CHECK(stations[0].columns[0].times
              == std::vector<int64_t> { t_2020 + 12 * hour,
                                        t_2020 + 13 * hour + 1800 });
        CHECK(stations[0].find("temperature")->numbers(0) == 20.0);
        CHECK(stations[0].find("report_type")->text[1] == "FM-12");
    }

    SECTION("Unparsable date cells")
    {
        const std::string text {
            "Station_name,Year,Month,Day,Hour,Minute,Latitude,Longitude\n"
            "A,2020,1,1,12,0,-34.0,18.5\n"
            "A,n/a,1,1,13,0,-34.0,18.5\n"
            "A,2020,1,1,14,0,-34.0,18.5\n"
        };
        std::istringstream unfiltered { text };
        const auto kept { lstmatch::parseStationTable(unfiltered, {}) };
        REQUIRE(kept.size() == 2);
        CHECK(kept.columns[0].times
              == std::vector<int64_t> { t_2020 + 12 * hour,
                                        t_2020 + 14 * hour });
        // The year filter sees the bad cell as NaN
        std::istringstream filtered { text };
        CHECK(lstmatch::parseStationTable(filtered, format).size() == 2);
    }

    SECTION("Date fields out of range")
    {
        std::istringstream in_range {
            "Station_name,Year,Month,Day,Hour,Minute,Latitude,Longitude\n"
            "A,1e12,1,1,12,0,-34.0,18.5\n"
            "A,2020,-1e12,1,12,0,-34.0,18.5\n"
            "A,2020,1,1,3e9,0,-34.0,18.5\n"
            "A,2020,1,1,12,2.5,-34.0,18.5\n"
            "A,0,1,1,12,0,-34.0,18.5\n"
            "A,2020,1,1,12,0,-34.0,18.5\n"
        };
        const auto kept { lstmatch::parseStationTable(in_range, {}) };
        REQUIRE(kept.size() == 1);
        CHECK(kept.columns[0].times[0] == t_2020 + 12 * hour);
    }

    SECTION("ISO timestamps")
    {
        lstmatch::StationFormat iso {};
        iso.datetime_columns = { "Time" };
        std::istringstream in_iso {
            "Station_name,Time,Latitude,Longitude\n"
            "A,2020-01-01T12:00:00Z,-34.0,18.5\n"
            "A,2020-01-01 13:30,-34.0,18.5\n"
            "A,not a time,-34.0,18.5\n"
            "A,2020-01-01,-34.0,18.5\n"
        };
        const auto kept { lstmatch::parseStationTable(in_iso, iso) };
        std::vector<std::string> names {};
        for (const auto& col : kept.columns) {
            names.push_back(col.name);
        }
        CHECK(names
              == std::vector<std::string> {
                "datetime", "station_name", "latitude", "longitude" });
        CHECK(kept.columns[0].times
              == std::vector<int64_t> { t_2020 + 12 * hour,
                                        t_2020 + 13 * hour + 1800,
                                        t_2020 });
    }

    SECTION("Delimited fields")
    {
        CHECK(lstmatch::splitDelimited("a|\"b|c\"|\"d\"\"e\"|", '|')
              == std::vector<std::string> { "a", "b|c", "d\"e", "" });
    }

    SECTION("Invalid input")
    {
        CHECK_THROWS_AS(lstmatch::parseFilter({ "year", "=>", "2020" }),
                        std::invalid_argument);
        CHECK_THROWS_AS(lstmatch::parseFilter({ "year", ">" }),
                        std::invalid_argument);
        std::istringstream short_row { "a,b\n1\n" };
        CHECK_THROWS_AS(lstmatch::parseStationTable(short_row, format),
                        std::invalid_argument);
        std::istringstream no_year { "station_name,month,day\nA,1,1\n" };
        CHECK_THROWS_AS(lstmatch::parseStationTable(no_year, format),
                        std::invalid_argument);
        lstmatch::StationFormat two_columns {};
        two_columns.datetime_columns = { "year", "month" };
        std::istringstream partial_date { "station_name,year,month\nA,1,1\n" };
        CHECK_THROWS_AS(lstmatch::parseStationTable(partial_date, two_columns),
                        std::invalid_argument);
    }
}

TEST_CASE("grid preparation")
{
    lstmatch::SceneStack scenes {};
    // Scenes 0 and 2 end up at the same time
    scenes.start_dates = { t_2020 + 86400 + 5 * hour,
                           t_2020 + 3 * hour,
                           t_2020 + 86400,
                           t_2020 + 2 * 86400 };
    scenes.y = Eigen::ArrayXd { { 1.0, 0.0 } };
    scenes.x = Eigen::ArrayXd { { 0.0 } };
    scenes.lst.resize(4, 2);
    scenes.lst << 300, NAN, 310, 311, 302, NAN, 320, 321;
    scenes.view_time.resize(4, 2);
    scenes.view_time << 10.25, 10.75, 11.5, NAN, 10.5, 10.5, NAN, NAN;
    scenes.view_angle.resize(4, 2);
    scenes.view_angle << 65, 65, 65, 110, 70, 60, 65, 65;

    SECTION("Scene times")
    {
        const auto times { lstmatch::sceneTimes(scenes) };
        CHECK(times[0] == t_2020 + 86400 + 10 * hour);
        CHECK(times[1] == t_2020 + 12 * hour);
        CHECK(times[2] == t_2020 + 86400 + 10 * hour);
        CHECK_FALSE(times[3].has_value());
    }

    SECTION("Averaging and sorting")
    {
        const auto grid { lstmatch::prepareGrid(scenes, {}) };
        CHECK(grid.getTimes()
              == std::vector<int64_t> { t_2020 + 12 * hour,
                                        t_2020 + 86400 + 10 * hour });
        CHECK(grid.getValues()(0, 0) == 310.0);
        CHECK(grid.getValues()(1, 0) == 301.0);
        CHECK(std::isnan(grid.getValues()(1, 1)));
    }

    SECTION("View angle mask")
    {
        const lstmatch::ViewAngleFilter filter {};
        ArrayXXd angles(3, 3);
        angles << 65, 70, 110, 65, 100, 30, NAN, NAN, NAN;
        const ArrayXb mask { lstmatch::viewAngleMask(angles, filter) };
        CHECK_FALSE(mask(0));
        CHECK(mask(1));
        CHECK_FALSE(mask(2));
    }

    SECTION("View angle filter")
    {
        // After averaging, the scene at 12h on the first day has one bad pixel
        // of two
        const auto grid { lstmatch::prepareGrid(scenes,
                                                lstmatch::ViewAngleFilter {}) };
        CHECK(grid.getTimes()
              == std::vector<int64_t> { t_2020 + 86400 + 10 * hour });
    }

    SECTION("Reading from file")
    {
        const std::string filename { tmp_dir + "/lstmatch_scenes.nc" };
        writeSceneStack(filename, scenes);
        lstmatch::SatelliteLayout layout {};
        layout.lst_variable = "LST_Day_1km";
        layout.view_time_variable = "Day_view_time";
        layout.view_angle_variable = "Day_view_angl";
        const auto grid { lstmatch::readSatelliteGrid(filename, layout, {}) };
        CHECK(grid.nTimes() == 2);
        CHECK(grid.getValues()(1, 0) == 301.0);
    }

    SECTION("Prepared grid with fill values")
    {
        const std::string filename { tmp_dir + "/lstmatch_grid.nc" };
        ArrayXXd values(2, 2);
        values << 1.0, NAN, 3.0, 4.0;
        writeGrid(filename,
                  { t_2020, t_2020 + hour },
                  scenes.y,
                  scenes.x,
                  values);
        lstmatch::SatelliteLayout layout {};
        layout.lst_variable = "LST_Day_1km";
        const auto grid { lstmatch::readSatelliteGrid(filename, layout, {}) };
        CHECK(grid.getTimes() == std::vector<int64_t> { t_2020, t_2020 + hour });
        CHECK(grid.getValues()(0, 0) == 1.0);
        CHECK(std::isnan(grid.getValues()(0, 1)));
    }
}

TEST_CASE("settings")
{
    SECTION("Default configuration")
    {
        const std::string config { lstmatch::SettingsMatchup {}.c_str(false) };
        const YAML::Node node { YAML::Load(config) };
        CHECK(node["matchup"]["match_tolerance"].as<double>() == 1.0);
        CHECK(node["matchup"]["lookback_tolerance"].as<double>() == 4.0);
        CHECK(node["matchup"]["previous_suffix"].as<std::string>() == "_prev");
        CHECK(node["stations"]["delimiter"].as<std::string>() == ",");
    }

    SECTION("Parameters are checked")
    {
        const std::string filename { tmp_dir + "/lstmatch_bad_config.yaml" };
        std::ofstream config { filename };
        config << "matchup:\n  match_tolerance: 2.0\n  lookback_tolerance: "
                  "1.0\n";
        config.close();
        lstmatch::SettingsMatchup settings { filename };
        CHECK_THROWS_AS(settings.init(), std::invalid_argument);
        config.open(filename);
        config << "stations:\n  datetime_columns: [year, month]\n";
        config.close();
        lstmatch::SettingsMatchup partial_date { filename };
        CHECK_THROWS_AS(partial_date.init(), std::invalid_argument);
    }
}
