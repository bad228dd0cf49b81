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

#include <string>

// The persisted authentication blob. Read when present, written once after
// an interactive login.
class AuthStore {
public:
    explicit AuthStore(const std::string& path);

    const std::string& path() const { return path_; }
    bool exists() const;

    // False when the file is missing or unreadable.
    bool load(std::string& state) const;

    // Writes to a temp file then renames.
    bool save(const std::string& state) const;

private:
    std::string path_;
};
