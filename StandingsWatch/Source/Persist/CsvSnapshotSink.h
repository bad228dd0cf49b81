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

#include <chrono>
#include <string>

#include "ISnapshotSink.h"

/**
 * @brief Writes each snapshot as one CSV file in a directory.
 *
 * Columns are Rank, Team Name, PMR, FPTS with empty cells for unresolved
 * values. The file name carries the UTC capture time and the timeIndex:
 * standings_YYYYmmdd_HHMMSS_<timeIndex>.csv
 */
class CsvSnapshotSink : public ISnapshotSink {
public:
    explicit CsvSnapshotSink(const std::string& directory);

    std::string persist(const StandingsSnapshot& snapshot,
        std::chrono::system_clock::time_point capturedAt) override;

    const std::string& directory() const { return directory_; }

    static std::string fileNameFor(std::chrono::system_clock::time_point capturedAt, long long timeIndex);
    static std::string toCsv(const StandingsSnapshot& snapshot);

    static const char* const header;

private:
    std::string directory_;
};
