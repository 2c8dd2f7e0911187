// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "joiner.h"

#include <cmath>
#include <stdexcept>

namespace lstmatch {

auto joinPairs(const StationSeries& series,
               const Annotations& annotations,
               const MatchMasks& masks,
               const StationSchema& schema,
               const std::string& previous_suffix) -> PairedTable
{
    std::vector<int> current_rows {};
    std::vector<int> anchor_rows {};
    for (int i {}; i < static_cast<int>(masks.is_current_match.size()); ++i) {
        if (masks.is_current_match(i)) {
            current_rows.push_back(i);
        }
        if (masks.is_previous_anchor(i)) {
            anchor_rows.push_back(i);
        }
    }
    if (current_rows.size() != anchor_rows.size()) {
        throw std::logic_error { "number of current matches and anchors "
                                 "differ" };
    }

    // Keep pairs with a defined grid value
    std::vector<int> kept_current {};
    std::vector<int> kept_anchor {};
    for (size_t k {}; k < current_rows.size(); ++k) {
        if (anchor_rows[k] + 1 != current_rows[k]) {
            throw std::logic_error { "anchor is not the predecessor of its "
                                     "current match" };
        }
        if (!std::isnan(annotations.matched_value(current_rows[k]))) {
            kept_current.push_back(current_rows[k]);
            kept_anchor.push_back(anchor_rows[k]);
        }
    }

    PairedTable table { .station = series.station };
    table.matched_value.resize(static_cast<int>(kept_current.size()));
    for (int k {}; k < static_cast<int>(kept_current.size()); ++k) {
        table.matched_value(k) = annotations.matched_value(kept_current[k]);
        table.matched_time.push_back(
          annotations.matched_time[kept_current[k]]);
    }
    for (const Column& col : series.columns) {
        table.columns.push_back(col.take(kept_current));
    }
    for (const Column& col : series.columns) {
        if (col.name == schema.latitude_column
            || col.name == schema.longitude_column) {
            continue;
        }
        Column prev { col.take(kept_anchor) };
        prev.name += previous_suffix;
        table.columns.push_back(std::move(prev));
    }
    return table;
}

} // namespace lstmatch
