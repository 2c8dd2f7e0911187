// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "grid_preparation.h"

#include <cmath>
#include <common/constants.h>
#include <common/time.h>
#include <map>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace lstmatch {

auto sceneTimes(const SceneStack& scenes)
  -> std::vector<std::optional<int64_t>>
{
    if (scenes.view_time.rows() != static_cast<int>(scenes.start_dates.size())) {
        throw std::invalid_argument {
            "number of view time scenes does not match number of start dates"
        };
    }
    std::vector<std::optional<int64_t>> times(scenes.start_dates.size());
    for (int i_scene {}; i_scene < scenes.view_time.rows(); ++i_scene) {
        const double mean_hour { nanMean(
          scenes.view_time.row(i_scene).transpose()) };
        if (std::isnan(mean_hour)) {
            continue;
        }
        // std::nearbyint rounds half to even in the default rounding mode
        times[i_scene] = floorToDay(scenes.start_dates[i_scene])
                         + static_cast<int64_t>(std::nearbyint(mean_hour))
                             * timeunit::hour;
    }
    return times;
}

auto viewAngleMask(const ArrayXXd& view_angle,
                   const ViewAngleFilter& filter) -> ArrayXb
{
    ArrayXb mask(view_angle.rows());
    for (int i_scene {}; i_scene < view_angle.rows(); ++i_scene) {
        int n_bad {};
        int n_good {};
        for (int i {}; i < view_angle.cols(); ++i) {
            const double zenith { std::abs(view_angle(i_scene, i)
                                           + filter.view_angle_offset) };
            if (zenith > filter.max_view_angle) {
                ++n_bad;
            } else if (zenith <= filter.max_view_angle) {
                ++n_good;
            }
        }
        mask(i_scene) =
          n_bad + n_good > 0
          && static_cast<double>(n_bad) / (n_bad + n_good)
               < filter.max_bad_angle_ratio;
    }
    return mask;
}

auto prepareGrid(const SceneStack& scenes,
                 const std::optional<ViewAngleFilter>& filter) -> GriddedLST
{
    const auto n_pixels { scenes.y.size() * scenes.x.size() };
    if (scenes.lst.rows() != static_cast<int>(scenes.start_dates.size())
        || scenes.lst.cols() != n_pixels) {
        throw std::invalid_argument { "LST scene stack has wrong dimensions" };
    }
    const bool has_angles { scenes.view_angle.size() > 0 };
    if (filter && !has_angles) {
        throw std::invalid_argument {
            "view angle filter requested but no view angle data present"
        };
    }
    if (has_angles
        && (scenes.view_angle.rows() != scenes.lst.rows()
            || scenes.view_angle.cols() != n_pixels)) {
        throw std::invalid_argument { "view angle stack has wrong dimensions" };
    }

    // Group scenes by time. The map orders the times.
    const auto times { sceneTimes(scenes) };
    std::map<int64_t, std::vector<int>> groups {};
    for (int i_scene {}; i_scene < static_cast<int>(times.size()); ++i_scene) {
        if (times[i_scene]) {
            groups[times[i_scene].value()].push_back(i_scene);
        } else {
            spdlog::warn("Dropping scene {} (start {}): no valid view time",
                         i_scene,
                         formatTimestamp(scenes.start_dates[i_scene]));
        }
    }
    if (groups.empty()) {
        throw std::invalid_argument { "no satellite scene has a view time" };
    }

    // Average each group ignoring NaN
    const auto average { [](const ArrayXXd& stack,
                            const std::vector<int>& rows) {
        Eigen::ArrayXd result(stack.cols());
        for (int i {}; i < stack.cols(); ++i) {
            double sum {};
            int n_valid {};
            for (const int row : rows) {
                if (!std::isnan(stack(row, i))) {
                    sum += stack(row, i);
                    ++n_valid;
                }
            }
            result(i) = n_valid > 0 ? sum / n_valid : fill::nan;
        }
        return result;
    } };
    const int n_times { static_cast<int>(groups.size()) };
    std::vector<int64_t> grid_times {};
    ArrayXXd lst(n_times, n_pixels);
    ArrayXXd angles(has_angles ? n_times : 0, has_angles ? n_pixels : 0);
    int i_time {};
    for (const auto& [time, rows] : groups) {
        if (rows.size() > 1) {
            spdlog::debug("Averaging {} scenes at {}",
                          rows.size(),
                          formatTimestamp(time));
        }
        grid_times.push_back(time);
        lst.row(i_time) = average(scenes.lst, rows).transpose();
        if (has_angles) {
            angles.row(i_time) =
              average(scenes.view_angle, rows).transpose();
        }
        ++i_time;
    }
    spdlog::info("Satellite scenes: {} read, {} unique times",
                 scenes.start_dates.size(),
                 n_times);

    if (!filter) {
        return { std::move(grid_times), scenes.y, scenes.x, std::move(lst) };
    }
    const ArrayXb keep { viewAngleMask(angles, *filter) };
    std::vector<int64_t> kept_times {};
    ArrayXXd kept_lst(keep.count(), n_pixels);
    for (int i {}; i < n_times; ++i) {
        if (keep(i)) {
            kept_lst.row(static_cast<int>(kept_times.size())) = lst.row(i);
            kept_times.push_back(grid_times[i]);
        }
    }
    spdlog::info("Scenes passing the view angle filter: {} of {}",
                 kept_times.size(),
                 n_times);
    if (kept_times.empty()) {
        throw std::invalid_argument {
            "no satellite scene passes the view angle filter"
        };
    }
    return { std::move(kept_times), scenes.y, scenes.x, std::move(kept_lst) };
}

} // namespace lstmatch
