// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Gridded land surface temperature with a nearest neighbour lookup.
// The lookup has no distance cutoff: every query point gets the
// closest cell in time, y and x, however far away it is. Judging
// whether a match is close enough is left to the caller.

#pragma once

#include <common/algorithm.h>
#include <common/eigen.h>

#include <array>
#include <cstdint>
#include <vector>

namespace lstmatch {

// One lookup point. index is the row of the station series the key
// was made from.
struct QueryKey
{
    int64_t time {};
    double y {};
    double x {};
    int index {};
};

// Result of a lookup. value is NaN if the matched cell has no data.
// time is the time coordinate of the matched cell.
struct GridSample
{
    double value {};
    int64_t time {};
};

class SatelliteGrid
{
public:
    // Return one sample per key in the order of keys. Keys outside
    // the grid are clamped to the edge cells.
    [[nodiscard]] virtual auto nearest(const std::vector<QueryKey>& keys) const
      -> std::vector<GridSample> = 0;
    virtual ~SatelliteGrid() = default;
};

// Grid held in memory. Time axis must be strictly increasing, the y
// and x axes strictly increasing or strictly decreasing. values has
// dimensions (time, y * x) with x running fastest.
class GriddedLST : public SatelliteGrid
{
private:
    std::vector<int64_t> times {};
    Eigen::ArrayXd y {};
    Eigen::ArrayXd x {};
    ArrayXXd values {};
    Monotonic y_direction { Monotonic::increasing };
    Monotonic x_direction { Monotonic::increasing };

public:
    GriddedLST(std::vector<int64_t> times,
               Eigen::ArrayXd y,
               Eigen::ArrayXd x,
               ArrayXXd values);

    [[nodiscard]] auto nearest(const std::vector<QueryKey>& keys) const
      -> std::vector<GridSample> override;

    [[nodiscard]] auto getTimes() const -> const std::vector<int64_t>&
    {
        return times;
    }
    [[nodiscard]] auto getValues() const -> const ArrayXXd& { return values; }
    [[nodiscard]] auto nTimes() const -> int
    {
        return static_cast<int>(times.size());
    }
    [[nodiscard]] auto firstTime() const -> int64_t { return times.front(); }
    [[nodiscard]] auto lastTime() const -> int64_t { return times.back(); }
    // Approximate cell size {y, x} in metres, assuming y and x are
    // latitude and longitude in degrees. The sign follows the axis
    // direction.
    [[nodiscard]] auto resolutionMetres() const -> std::array<double, 2>;
};

} // namespace lstmatch
