// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Writing and reading the matchup product

#pragma once

#include "matchup.h"

namespace lstmatch {

// Write all pairs of all stations along one pair dimension, together
// with the list of failed stations and the configuration. argc and
// argv are for the history attribute.
auto writeMatchup(const std::string& filename,
                  const std::string& config,
                  const MatchupResult& result,
                  const bool compress,
                  const int argc = 0,
                  const char* const argv[] = nullptr) -> void;

// Read a matchup product back as one table per station, in the order
// of the file
[[nodiscard]] auto readMatchup(const std::string& filename)
  -> MatchupResult;

} // namespace lstmatch
