// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Wall clock timer for processing stages. Only the master OpenMP
// thread updates the timer.

#pragma once

#include <chrono>
#include <string>

namespace lstmatch {

class Timer
{
private:
    std::string label {};
    std::chrono::time_point<std::chrono::steady_clock> wall_timestamp;
    double total_wall_time {};

public:
    explicit Timer(const std::string& label) : label { label } {}
    auto start() -> void;
    auto stop() -> void;
    // Log the label and the total wall time
    auto report() const -> void;
};

} // namespace lstmatch
