// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "window_classifier.h"

#include <cmath>

namespace lstmatch {

auto classifyWindows(const Eigen::ArrayXd& offset_hours,
                     const WindowTolerances& tolerances) -> MatchMasks
{
    const int n { static_cast<int>(offset_hours.size()) };
    // Comparisons with NaN are false
    ArrayXb current(n);
    for (int i {}; i < n; ++i) {
        current(i) = std::abs(offset_hours(i)) <= tolerances.match;
    }
    // Row i can only be an anchor for the current match following it
    ArrayXb anchor_candidate(n);
    ArrayXb anchor_within_bound(n);
    for (int i {}; i < n; ++i) {
        anchor_candidate(i) = i + 1 < n && current(i + 1);
        anchor_within_bound(i) =
          anchor_candidate(i)
          && std::abs(offset_hours(i)) <= tolerances.lookback;
    }
    MatchMasks masks { .is_current_match = ArrayXb(n),
                       .is_previous_anchor = ArrayXb(n) };
    for (int i {}; i < n; ++i) {
        const bool has_valid_anchor { i > 0 && anchor_within_bound(i - 1) };
        masks.is_current_match(i) = current(i) && has_valid_anchor;
        masks.is_previous_anchor(i) =
          anchor_candidate(i) && anchor_within_bound(i);
    }
    return masks;
}

} // namespace lstmatch
