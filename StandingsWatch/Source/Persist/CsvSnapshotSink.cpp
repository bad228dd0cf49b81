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
#include "CsvSnapshotSink.h"
#include "CsvFormat.h"
#include "../Standings/StandingsSnapshot.h"
#include "../Utility/Errors.h"
#include "../Utility/Log.h"
#include "../Utility/Utils.h"
#include <ctime>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

const char* const CsvSnapshotSink::header = "Rank,Team Name,PMR,FPTS";

CsvSnapshotSink::CsvSnapshotSink(const std::string& directory)
    : directory_(directory)
{
}

std::string CsvSnapshotSink::fileNameFor(std::chrono::system_clock::time_point capturedAt, long long timeIndex)
{
    std::time_t t = std::chrono::system_clock::to_time_t(capturedAt);
    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &t);
#else
    gmtime_r(&t, &utc);
#endif
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &utc);
    return "standings_" + std::string(stamp) + "_" + std::to_string(timeIndex) + ".csv";
}

std::string CsvSnapshotSink::toCsv(const StandingsSnapshot& snapshot)
{
    std::string out = header;
    out += "\n";
    for (const auto& row : snapshot.entries()) {
        out += CsvFormat::joinRecord({
            CsvFormat::formatInteger(row.rank),
            row.teamName.value_or(""),
            CsvFormat::formatInteger(row.pmr),
            CsvFormat::formatNumber(row.fpts) });
        out += "\n";
    }
    return out;
}

std::string CsvSnapshotSink::persist(const StandingsSnapshot& snapshot,
    std::chrono::system_clock::time_point capturedAt)
{
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        throw TransientPollError("cannot create snapshot directory " + directory_ + ": " + ec.message());
    }

    std::string path = Utils::combinePath(directory_, fileNameFor(capturedAt, snapshot.timeIndex()));
    std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw TransientPollError("cannot open " + tmp + " for writing");
        }
        out << toCsv(snapshot);
        out.flush();
        if (!out) {
            out.close();
            fs::remove(tmp, ec);
            throw TransientPollError("short write to " + tmp);
        }
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw TransientPollError("cannot move snapshot into place at " + path + ": " + ec.message());
    }

    LOG_INFO("Snapshots", "Wrote " << snapshot.size() << " rows to " << path);
    return path;
}
