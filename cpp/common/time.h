// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Time and date related functions. Timestamps are integer seconds
// since 1970-01-01T00:00:00Z (UTC, no leap seconds).

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace lstmatch {

// Range of years accepted by toTimestamp
constexpr int min_year { 1 };
constexpr int max_year { 9999 };

auto getDate() -> std::string;

// Format YYYY-mm-ddTHH:MM:SSZ
auto getDateAndTime() -> std::string;

// Convert a calendar date and time of day into a timestamp. Returns
// nothing if any of the fields is out of range (e.g. month 13,
// 31 April or year 0).
[[nodiscard]] auto toTimestamp(const int year,
                               const int month,
                               const int day,
                               const int hour = 0,
                               const int minute = 0,
                               const int second = 0) -> std::optional<int64_t>;

// Parse YYYY-mm-dd, YYYY-mm-ddTHH:MM or YYYY-mm-ddTHH:MM:SS with an
// optional trailing Z. A space may be used instead of T.
[[nodiscard]] auto parseTimestamp(const std::string& str)
  -> std::optional<int64_t>;

// Format a timestamp as YYYY-mm-ddTHH:MM:SSZ
[[nodiscard]] auto formatTimestamp(const int64_t timestamp) -> std::string;

// Start of the day (00:00 UTC) the timestamp falls on
[[nodiscard]] auto floorToDay(const int64_t timestamp) -> int64_t;

// Signed difference a - b in hours
[[nodiscard]] auto hoursBetween(const int64_t a, const int64_t b) -> double;

} // namespace lstmatch
