// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "algorithm.h"

#include "constants.h"

#include <cmath>
#include <stdexcept>

namespace lstmatch {

auto monotonicity(const Eigen::ArrayXd& axis) -> Monotonic
{
    bool increasing { true };
    bool decreasing { axis.size() > 1 };
    for (int i { 1 }; i < static_cast<int>(axis.size()); ++i) {
        // Comparisons with NaN are false which rules out both
        increasing = increasing && axis(i) > axis(i - 1);
        decreasing = decreasing && axis(i) < axis(i - 1);
    }
    if (axis.size() == 1 && std::isnan(axis(0))) {
        return Monotonic::none;
    }
    if (increasing) {
        return Monotonic::increasing;
    }
    return decreasing ? Monotonic::decreasing : Monotonic::none;
}

auto monotonicity(const std::vector<int64_t>& axis) -> Monotonic
{
    bool increasing { true };
    bool decreasing { axis.size() > 1 };
    for (size_t i { 1 }; i < axis.size(); ++i) {
        increasing = increasing && axis[i] > axis[i - 1];
        decreasing = decreasing && axis[i] < axis[i - 1];
    }
    if (increasing) {
        return Monotonic::increasing;
    }
    return decreasing ? Monotonic::decreasing : Monotonic::none;
}

// Locate the first element that is not before x in the direction of
// the axis and pick between it and its predecessor. before(a, b)
// tells whether a comes before b along the axis.
template <typename Axis, typename T, typename Before>
static auto nearestIdxImpl(const Axis& axis,
                           const int n,
                           const T x,
                           const Before before) -> int
{
    if (!before(axis[0], x)) {
        return 0;
    }
    if (before(axis[n - 1], x)) {
        return n - 1;
    }
    // Invariant: axis[i_begin] before x, axis[i_end] not before x
    int i_begin {};
    int i_end { n - 1 };
    while (i_end - i_begin > 1) {
        const int i_mid { (i_begin + i_end) / 2 };
        if (before(axis[i_mid], x)) {
            i_begin = i_mid;
        } else {
            i_end = i_mid;
        }
    }
    const auto dist_begin { x > axis[i_begin] ? x - axis[i_begin]
                                              : axis[i_begin] - x };
    const auto dist_end { x > axis[i_end] ? x - axis[i_end]
                                          : axis[i_end] - x };
    return dist_end < dist_begin ? i_end : i_begin;
}

auto nearestIdx(const Eigen::ArrayXd& axis,
                const Monotonic direction,
                const double x) -> int
{
    if (axis.size() == 0) {
        throw std::invalid_argument { "nearestIdx: empty axis" };
    }
    if (std::isnan(x)) {
        return 0;
    }
    const int n { static_cast<int>(axis.size()) };
    if (direction == Monotonic::decreasing) {
        return nearestIdxImpl(
          axis, n, x, [](const double a, const double b) { return a > b; });
    }
    return nearestIdxImpl(
      axis, n, x, [](const double a, const double b) { return a < b; });
}

auto nearestIdx(const std::vector<int64_t>& axis, const int64_t x) -> int
{
    if (axis.empty()) {
        throw std::invalid_argument { "nearestIdx: empty axis" };
    }
    return nearestIdxImpl(axis,
                          static_cast<int>(axis.size()),
                          x,
                          [](const int64_t a, const int64_t b) { return a < b; });
}

auto nanMean(const Eigen::ArrayXd& values) -> double
{
    double sum {};
    int n_valid {};
    for (const double value : values) {
        if (!std::isnan(value)) {
            sum += value;
            ++n_valid;
        }
    }
    return n_valid > 0 ? sum / n_valid : fill::nan;
}

} // namespace lstmatch
