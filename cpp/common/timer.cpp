// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "timer.h"

#include <omp.h>
#include <spdlog/spdlog.h>

namespace lstmatch {

auto Timer::start() -> void
{
    if (omp_get_thread_num() == 0) {
        wall_timestamp = std::chrono::steady_clock::now();
    }
}

auto Timer::stop() -> void
{
    if (omp_get_thread_num() == 0) {
        total_wall_time +=
          std::chrono::duration<double>(std::chrono::steady_clock::now()
                                        - wall_timestamp)
            .count();
    }
}

auto Timer::report() const -> void
{
    spdlog::info("{:<24} {:8.3f} s", label.empty() ? "Time:" : label + ':',
                 total_wall_time);
}

} // namespace lstmatch
