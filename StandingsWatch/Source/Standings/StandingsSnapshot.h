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
#pragma once

#include <optional>
#include <string>
#include <vector>

// One leaderboard row as read from the page. Any field may be unresolved.
struct StandingsRow {
    std::optional<int> rank;
    std::optional<std::string> teamName;   // stable identity
    std::optional<int> pmr;                // player minutes remaining, >= 0
    std::optional<double> fpts;            // current fantasy points

    bool hasAnyField() const {
        return rank || teamName || pmr || fpts;
    }

    bool operator==(const StandingsRow& other) const {
        return rank == other.rank && teamName == other.teamName &&
            pmr == other.pmr && fpts == other.fpts;
    }
};

// A complete, deduplicated leaderboard at one timeIndex. Immutable once built.
class StandingsSnapshot {
public:
    StandingsSnapshot() = default;

    // Drops repeated team names (first wins) and orders by rank when every
    // entry has one; otherwise keeps the given order.
    StandingsSnapshot(long long timeIndex, std::vector<StandingsRow> entries);

    long long timeIndex() const { return timeIndex_; }
    const std::vector<StandingsRow>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    const StandingsRow* find(const std::string& teamName) const;

private:
    long long timeIndex_ = 0;
    std::vector<StandingsRow> entries_;
};
