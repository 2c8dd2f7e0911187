// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#pragma once

namespace lstmatch {

class SettingsMatchup;

// argc and argv are for generating the history attribute
auto driver(const SettingsMatchup& settings,
            const int argc = 0,
            const char* const argv[] = nullptr) -> void;

} // namespace lstmatch
