// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "time.h"

#include "constants.h"

#include <cstdio>
#include <ctime>

namespace lstmatch {

constexpr int date_size { 100 };

auto getDate() -> std::string
{
    std::time_t t { std::time(nullptr) };
    char date[date_size] {};
    std::strftime(
      date, date_size * sizeof(char), "%Y %B %d %a UTC%z", std::localtime(&t));
    return date;
}

auto getDateAndTime() -> std::string
{
    std::time_t t { std::time(nullptr) };
    char date_and_time[date_size] {};
    std::strftime(
      date_and_time, date_size * sizeof(char), "%FT%TZ", std::gmtime(&t));
    return date_and_time;
}

static auto isLeap(const int year) -> bool
{
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

static auto daysInMonth(const int year, const int month) -> int
{
    constexpr int month_days[12] { 31, 28, 31, 30, 31, 30,
                                   31, 31, 30, 31, 30, 31 };
    return month == 2 && isLeap(year) ? 29 : month_days[month - 1];
}

// Number of days from 1970-01-01 to the given date in the proleptic
// Gregorian calendar. Algorithm by H. Hinnant (days_from_civil).
static auto daysFromCivil(const int year,
                          const int month,
                          const int day) -> int64_t
{
    const int64_t y { month <= 2 ? year - 1 : year };
    const int64_t era { (y >= 0 ? y : y - 399) / 400 };
    const int64_t yoe { y - era * 400 };
    const int64_t mp { (month + 9) % 12 };
    const int64_t doy { (153 * mp + 2) / 5 + day - 1 };
    const int64_t doe { yoe * 365 + yoe / 4 - yoe / 100 + doy };
    return era * 146097 + doe - 719468;
}

// Inverse of daysFromCivil
static auto civilFromDays(const int64_t days, int& year, int& month, int& day)
  -> void
{
    const int64_t z { days + 719468 };
    const int64_t era { (z >= 0 ? z : z - 146096) / 146097 };
    const int64_t doe { z - era * 146097 };
    const int64_t yoe { (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365 };
    const int64_t doy { doe - (365 * yoe + yoe / 4 - yoe / 100) };
    const int64_t mp { (5 * doy + 2) / 153 };
    day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    year = static_cast<int>(yoe + era * 400 + (month <= 2 ? 1 : 0));
}

auto toTimestamp(const int year,
                 const int month,
                 const int day,
                 const int hour,
                 const int minute,
                 const int second) -> std::optional<int64_t>
{
    if (year < min_year || year > max_year || month < 1 || month > 12
        || day < 1 || day > daysInMonth(year, month)
        || hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0
        || second > 59) {
        return {};
    }
    return daysFromCivil(year, month, day) * timeunit::day
           + hour * timeunit::hour + minute * timeunit::minute + second;
}

auto parseTimestamp(const std::string& str) -> std::optional<int64_t>
{
    int year {};
    int month {};
    int day {};
    int hour {};
    int minute {};
    int second {};
    char sep {};
    int n_chars {};
    const int n_fields { std::sscanf(str.c_str(),
                                     "%d-%d-%d%c%d:%d:%d%n",
                                     &year,
                                     &month,
                                     &day,
                                     &sep,
                                     &hour,
                                     &minute,
                                     &second,
                                     &n_chars) };
    if (n_fields == 3) {
        if (std::sscanf(str.c_str(), "%d-%d-%d%n", &year, &month, &day, &n_chars)
              != 3
            || n_chars != static_cast<int>(str.size())) {
            return {};
        }
        return toTimestamp(year, month, day);
    }
    if (n_fields < 6 || (sep != 'T' && sep != ' ')) {
        return {};
    }
    if (n_fields == 6) {
        second = 0;
        std::sscanf(str.c_str(),
                    "%d-%d-%d%c%d:%d%n",
                    &year,
                    &month,
                    &day,
                    &sep,
                    &hour,
                    &minute,
                    &n_chars);
    }
    const std::string rest { str.substr(static_cast<size_t>(n_chars)) };
    if (!rest.empty() && rest != "Z") {
        return {};
    }
    return toTimestamp(year, month, day, hour, minute, second);
}

auto formatTimestamp(const int64_t timestamp) -> std::string
{
    const int64_t days { floorToDay(timestamp) / timeunit::day };
    const int64_t secs { timestamp - days * timeunit::day };
    int year {};
    int month {};
    int day {};
    civilFromDays(days, year, month, day);
    char buf[date_size] {};
    std::snprintf(buf,
                  date_size,
                  "%04d-%02d-%02dT%02d:%02d:%02dZ",
                  year,
                  month,
                  day,
                  static_cast<int>(secs / timeunit::hour),
                  static_cast<int>(secs % timeunit::hour / timeunit::minute),
                  static_cast<int>(secs % timeunit::minute));
    return buf;
}

auto floorToDay(const int64_t timestamp) -> int64_t
{
    int64_t days { timestamp / timeunit::day };
    if (timestamp % timeunit::day < 0) {
        --days;
    }
    return days * timeunit::day;
}

auto hoursBetween(const int64_t a, const int64_t b) -> double
{
    return static_cast<double>(a - b) / timeunit::seconds_per_hour;
}

} // namespace lstmatch
