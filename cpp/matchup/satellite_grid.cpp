// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "satellite_grid.h"

#include <cmath>
#include <common/constants.h>
#include <stdexcept>
#include <utility>

namespace lstmatch {

GriddedLST::GriddedLST(std::vector<int64_t> times,
                       Eigen::ArrayXd y,
                       Eigen::ArrayXd x,
                       ArrayXXd values)
  : times { std::move(times) }
  , y { std::move(y) }
  , x { std::move(x) }
  , values { std::move(values) }
{
    if (this->times.empty() || this->y.size() == 0 || this->x.size() == 0) {
        throw std::invalid_argument { "satellite grid has an empty dimension" };
    }
    if (monotonicity(this->times) != Monotonic::increasing) {
        throw std::invalid_argument {
            "satellite grid times must be strictly increasing"
        };
    }
    y_direction = monotonicity(this->y);
    x_direction = monotonicity(this->x);
    if (y_direction == Monotonic::none || x_direction == Monotonic::none) {
        throw std::invalid_argument {
            "satellite grid y and x coordinates must be strictly monotonic"
        };
    }
    if (this->values.rows() != static_cast<int>(this->times.size())
        || this->values.cols() != this->y.size() * this->x.size()) {
        throw std::invalid_argument {
            "satellite grid values have dimensions ("
            + std::to_string(this->values.rows()) + ", "
            + std::to_string(this->values.cols()) + "), expected ("
            + std::to_string(this->times.size()) + ", "
            + std::to_string(this->y.size() * this->x.size()) + ")"
        };
    }
}

auto GriddedLST::nearest(const std::vector<QueryKey>& keys) const
  -> std::vector<GridSample>
{
    std::vector<GridSample> samples(keys.size());
    for (size_t i {}; i < keys.size(); ++i) {
        const int i_time { nearestIdx(times, keys[i].time) };
        const int i_y { nearestIdx(y, y_direction, keys[i].y) };
        const int i_x { nearestIdx(x, x_direction, keys[i].x) };
        samples[i].value = values(i_time, i_y * x.size() + i_x);
        samples[i].time = times[i_time];
    }
    return samples;
}

auto GriddedLST::resolutionMetres() const -> std::array<double, 2>
{
    const double cos_lat { std::cos(y.mean() * math::deg_to_rad) };
    // Mean spacing of an axis, 0 for a single element
    const auto spacing { [](const Eigen::ArrayXd& axis) {
        return axis.size() > 1 ? (axis(axis.size() - 1) - axis(0))
                                   / static_cast<double>(axis.size() - 1)
                               : 0.0;
    } };
    return { std::nearbyint(spacing(y) * earth::metres_per_degree),
             std::nearbyint(spacing(x) * earth::metres_per_degree * cos_lat) };
}

} // namespace lstmatch
