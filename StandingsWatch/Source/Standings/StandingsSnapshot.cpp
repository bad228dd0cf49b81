/* This file is part of StandingsWatch.
 *
 * StandingsWatch is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * StandingsWatch is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with StandingsWatch.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "StandingsSnapshot.h"
#include <algorithm>
#include <unordered_set>

StandingsSnapshot::StandingsSnapshot(long long timeIndex, std::vector<StandingsRow> entries)
    : timeIndex_(timeIndex)
{
    std::unordered_set<std::string> seen;
    entries_.reserve(entries.size());
    for (auto& row : entries) {
        if (row.teamName && !seen.insert(*row.teamName).second) {
            continue;
        }
        entries_.push_back(std::move(row));
    }

    bool allRanked = std::all_of(entries_.begin(), entries_.end(),
        [](const StandingsRow& r) { return r.rank.has_value(); });
    if (allRanked) {
        std::stable_sort(entries_.begin(), entries_.end(),
            [](const StandingsRow& a, const StandingsRow& b) { return *a.rank < *b.rank; });
    }
}

const StandingsRow* StandingsSnapshot::find(const std::string& teamName) const
{
    for (const auto& row : entries_) {
        if (row.teamName && *row.teamName == teamName) {
            return &row;
        }
    }
    return nullptr;
}
