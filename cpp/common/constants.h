// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#pragma once

#include <cstdint>
#include <limits>

namespace lstmatch {

// Fill values to denote a missing value
namespace fill {

// Missing numeric station or grid value
constexpr double nan { std::numeric_limits<double>::quiet_NaN() };

} // namespace fill

// Time related. All timestamps in this project are integer seconds
// since 1970-01-01T00:00:00Z.
namespace timeunit {

constexpr int64_t minute { 60 };
constexpr int64_t hour { 3600 };
constexpr int64_t day { 86400 };
constexpr double seconds_per_hour { 3600.0 };

} // namespace timeunit

// Geolocation related
namespace earth {

// Approximate length of one degree of latitude
constexpr double metres_per_degree { 111000.0 };

} // namespace earth

namespace math {

// Multiply with this factor to convert from degrees to radians
constexpr double deg_to_rad { 0.017453292519943295 };

} // namespace math

} // namespace lstmatch
