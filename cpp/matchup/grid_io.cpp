// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "grid_io.h"

#include <cmath>
#include <common/constants.h>
#include <netcdf>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace lstmatch {

// Read a 1D variable as doubles
static auto readAxis(const netCDF::NcFile& nc,
                     const std::string& name) -> Eigen::ArrayXd
{
    const auto nc_var { nc.getVar(name) };
    if (nc_var.isNull()) {
        throw std::runtime_error { "variable " + name + " not found" };
    }
    if (nc_var.getDimCount() != 1) {
        throw std::runtime_error { "variable " + name + " must be 1D" };
    }
    Eigen::ArrayXd axis(nc_var.getDim(0).getSize());
    nc_var.getVar(axis.data());
    return axis;
}

// Read timestamps stored either as integers or as floating point
// seconds
static auto readTimes(const netCDF::NcFile& nc,
                      const std::string& name) -> std::vector<int64_t>
{
    const Eigen::ArrayXd seconds { readAxis(nc, name) };
    std::vector<int64_t> times(seconds.size());
    for (int i {}; i < static_cast<int>(seconds.size()); ++i) {
        if (!std::isfinite(seconds(i))) {
            throw std::runtime_error { "invalid value in " + name };
        }
        times[i] = std::llround(seconds(i));
    }
    return times;
}

// Read a (time, y, x) variable into a (time, y * x) array
static auto readStack(const netCDF::NcFile& nc,
                      const std::string& name,
                      const size_t n_times,
                      const size_t n_y,
                      const size_t n_x) -> ArrayXXd
{
    const auto nc_var { nc.getVar(name) };
    if (nc_var.isNull()) {
        throw std::runtime_error { "variable " + name + " not found" };
    }
    if (nc_var.getDimCount() != 3 || nc_var.getDim(0).getSize() != n_times
        || nc_var.getDim(1).getSize() != n_y
        || nc_var.getDim(2).getSize() != n_x) {
        throw std::runtime_error { "variable " + name
                                   + " must have dimensions ("
                                   + std::to_string(n_times) + ", "
                                   + std::to_string(n_y) + ", "
                                   + std::to_string(n_x) + ")" };
    }
    ArrayXXd stack(n_times, n_y * n_x);
    nc_var.getVar(stack.data());
    const auto atts { nc_var.getAtts() };
    if (const auto it { atts.find("_FillValue") }; it != atts.end()) {
        double fill_value {};
        it->second.getValues(&fill_value);
        stack = (stack == fill_value).select(fill::nan, stack);
    }
    return stack;
}

auto readSceneStack(const std::string& filename,
                    const SatelliteLayout& layout) -> SceneStack
{
    const netCDF::NcFile nc { filename, netCDF::NcFile::read };
    SceneStack scenes {};
    scenes.start_dates = readTimes(nc, layout.start_date_variable);
    scenes.y = readAxis(nc, "y");
    scenes.x = readAxis(nc, "x");
    const auto n_scenes { scenes.start_dates.size() };
    const auto n_y { static_cast<size_t>(scenes.y.size()) };
    const auto n_x { static_cast<size_t>(scenes.x.size()) };
    scenes.lst = readStack(nc, layout.lst_variable, n_scenes, n_y, n_x);
    scenes.view_time =
      readStack(nc, layout.view_time_variable, n_scenes, n_y, n_x);
    if (!layout.view_angle_variable.empty()) {
        scenes.view_angle =
          readStack(nc, layout.view_angle_variable, n_scenes, n_y, n_x);
    }
    spdlog::info("Scene stack dimensions (scene, y, x): ({}, {}, {})",
                 n_scenes,
                 n_y,
                 n_x);
    return scenes;
}

auto readSatelliteGrid(const std::string& filename,
                       const SatelliteLayout& layout,
                       const std::optional<ViewAngleFilter>& filter)
  -> GriddedLST
{
    if (!layout.view_time_variable.empty()) {
        return prepareGrid(readSceneStack(filename, layout), filter);
    }
    if (filter) {
        spdlog::warn("View angle filter ignored for a prepared grid");
    }
    const netCDF::NcFile nc { filename, netCDF::NcFile::read };
    auto times { readTimes(nc, layout.time_variable) };
    auto y { readAxis(nc, "y") };
    auto x { readAxis(nc, "x") };
    auto values { readStack(nc,
                            layout.lst_variable,
                            times.size(),
                            static_cast<size_t>(y.size()),
                            static_cast<size_t>(x.size())) };
    spdlog::info("Grid dimensions (time, y, x): ({}, {}, {})",
                 times.size(),
                 y.size(),
                 x.size());
    return { std::move(times), std::move(y), std::move(x), std::move(values) };
}

} // namespace lstmatch
