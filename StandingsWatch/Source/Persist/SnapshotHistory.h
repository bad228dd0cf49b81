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

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "../Standings/StandingsSnapshot.h"

/**
 * @brief Ordered series of persisted snapshots, keyed by timeIndex.
 *
 * The timeIndex of a file is the last '_'-separated integer of its name
 * before ".csv". Files whose name carries no integer are skipped.
 */
class SnapshotHistory {
public:
    // Returns the number of snapshots now held. Later files replace earlier
    // ones with the same timeIndex (files are visited in name order).
    size_t loadDirectory(const std::string& directory);

    // Parses one CSV file. False (with reason) on unreadable or headerless input.
    static bool readCsv(const std::string& path, std::vector<StandingsRow>& rows, std::string& error);
    static bool parseCsv(const std::string& text, std::vector<StandingsRow>& rows, std::string& error);

    static std::optional<long long> timeIndexFromFileName(const std::string& fileName);

    void add(const StandingsSnapshot& snapshot);

    bool empty() const { return series_.empty(); }
    size_t size() const { return series_.size(); }

    // nullptr when empty / absent
    const StandingsSnapshot* latest() const;
    const StandingsSnapshot* at(long long timeIndex) const;

    std::vector<long long> timeIndices() const;

    // FPTS of one team over time; snapshots where the team is absent or its
    // points are unresolved are left out.
    std::vector<std::pair<long long, double>> seriesFor(const std::string& teamName) const;

private:
    std::map<long long, StandingsSnapshot> series_;
};
