// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "selector.h"

#include <algorithm>

namespace lstmatch {

auto selectKeys(const StationSeries& series,
                const StationSchema& schema) -> std::vector<QueryKey>
{
    const auto& times { series.column(schema.time_column, ColumnType::time)
                          .times };
    const auto& lat {
        series.column(schema.latitude_column, ColumnType::numeric).numbers
    };
    const auto& lon {
        series.column(schema.longitude_column, ColumnType::numeric).numbers
    };
    std::vector<QueryKey> keys(times.size());
    for (int i {}; i < static_cast<int>(times.size()); ++i) {
        keys[i] = { times[i], lat(i), lon(i), i };
    }
    std::ranges::stable_sort(keys, {}, &QueryKey::time);
    return keys;
}

} // namespace lstmatch
