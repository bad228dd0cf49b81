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
#include "SnapshotHistory.h"
#include "CsvFormat.h"
#include "../Utility/Log.h"
#include "../Utility/Utils.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <climits>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

namespace {

std::optional<int> toInteger(const std::optional<double>& value)
{
    if (!value || *value < INT_MIN || *value > INT_MAX) {
        return std::nullopt;
    }
    return static_cast<int>(std::trunc(*value));
}

}

std::optional<long long> SnapshotHistory::timeIndexFromFileName(const std::string& fileName)
{
    std::string name = Utils::getFileName(fileName);
    const std::string ext = ".csv";
    if (name.size() <= ext.size() || Utils::toLower(name.substr(name.size() - ext.size())) != ext) {
        return std::nullopt;
    }
    std::string stem = name.substr(0, name.size() - ext.size());
    size_t underscore = stem.find_last_of('_');
    std::string last = underscore == std::string::npos ? stem : stem.substr(underscore + 1);

    size_t start = (!last.empty() && last[0] == '-') ? 1 : 0;
    if (last.size() == start || last.size() - start > 18) {
        return std::nullopt;
    }
    for (size_t i = start; i < last.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(last[i]))) {
            return std::nullopt;
        }
    }
    return std::stoll(last);
}

bool SnapshotHistory::parseCsv(const std::string& text, std::vector<StandingsRow>& rows, std::string& error)
{
    std::vector<std::vector<std::string>> records = CsvFormat::parseRecords(text);
    if (records.empty()) {
        error = "no header";
        return false;
    }

    int rankCol = -1, teamCol = -1, pmrCol = -1, fptsCol = -1;
    const std::vector<std::string>& header = records.front();
    for (size_t i = 0; i < header.size(); ++i) {
        std::string name = header[i];
        name = Utils::toLower(Utils::trim(name));
        if (name == "rank") rankCol = static_cast<int>(i);
        else if (name == "team name") teamCol = static_cast<int>(i);
        else if (name == "pmr") pmrCol = static_cast<int>(i);
        else if (name == "fpts") fptsCol = static_cast<int>(i);
    }
    if (teamCol < 0) {
        error = "missing Team Name column";
        return false;
    }

    auto cell = [](const std::vector<std::string>& record, int col) -> std::string {
        if (col < 0 || static_cast<size_t>(col) >= record.size()) return std::string();
        return record[col];
    };

    for (size_t r = 1; r < records.size(); ++r) {
        const std::vector<std::string>& record = records[r];
        StandingsRow row;
        row.rank = toInteger(CsvFormat::parseOptionalNumber(cell(record, rankCol)));
        std::string team = cell(record, teamCol);
        team = Utils::trim(team);
        if (!team.empty()) row.teamName = team;
        row.pmr = toInteger(CsvFormat::parseOptionalNumber(cell(record, pmrCol)));
        row.fpts = CsvFormat::parseOptionalNumber(cell(record, fptsCol));
        if (row.hasAnyField()) {
            rows.push_back(row);
        }
    }
    return true;
}

bool SnapshotHistory::readCsv(const std::string& path, std::vector<StandingsRow>& rows, std::string& error)
{
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        error = "cannot open " + path;
        return false;
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        error = "read error on " + path;
        return false;
    }
    return parseCsv(text, rows, error);
}

size_t SnapshotHistory::loadDirectory(const std::string& directory)
{
    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        LOG_WARNING("History", "Snapshot directory does not exist: " << directory);
        return series_.size();
    }

    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(directory, ec)) {
        std::error_code typeEc;
        if (entry.is_regular_file(typeEc)) {
            files.push_back(entry.path());
        }
    }
    if (ec) {
        LOG_WARNING("History", "Listing " << directory << " failed: " << ec.message());
    }
    std::sort(files.begin(), files.end());

    int skipped = 0;
    for (const auto& file : files) {
        std::optional<long long> timeIndex = timeIndexFromFileName(file.filename().string());
        if (!timeIndex) {
            skipped++;
            continue;
        }
        std::vector<StandingsRow> rows;
        std::string error;
        if (!readCsv(file.string(), rows, error)) {
            LOG_WARNING("History", "Skipping " << file.string() << ": " << error);
            continue;
        }
        series_[*timeIndex] = StandingsSnapshot(*timeIndex, std::move(rows));
    }

    if (skipped > 0) {
        LOG_DEBUG("History", "Ignored " << skipped << " files without a time index in " << directory);
    }
    LOG_INFO("History", "Loaded " << series_.size() << " snapshots from " << directory);
    return series_.size();
}

void SnapshotHistory::add(const StandingsSnapshot& snapshot)
{
    series_[snapshot.timeIndex()] = snapshot;
}

const StandingsSnapshot* SnapshotHistory::latest() const
{
    if (series_.empty()) return nullptr;
    return &series_.rbegin()->second;
}

const StandingsSnapshot* SnapshotHistory::at(long long timeIndex) const
{
    auto it = series_.find(timeIndex);
    return it == series_.end() ? nullptr : &it->second;
}

std::vector<long long> SnapshotHistory::timeIndices() const
{
    std::vector<long long> out;
    out.reserve(series_.size());
    for (const auto& kv : series_) {
        out.push_back(kv.first);
    }
    return out;
}

std::vector<std::pair<long long, double>> SnapshotHistory::seriesFor(const std::string& teamName) const
{
    std::vector<std::pair<long long, double>> out;
    for (const auto& kv : series_) {
        const StandingsRow* row = kv.second.find(teamName);
        if (row && row->fpts) {
            out.emplace_back(kv.first, *row->fpts);
        }
    }
    return out;
}
