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
#include <vector>

class Configuration;

// One way of reading a field out of a row. First strategy with text wins.
struct FieldStrategy {
    std::string name;
    std::string selector;      // empty = the row element itself
    std::string attribute;     // empty = element text
    std::string stripPrefix;   // required prefix, removed from the value
};

struct ExtractionProfile {
    std::string containerSelector;     // what the browser serializes
    std::string rowSelector;
    std::vector<FieldStrategy> rank;
    std::vector<FieldStrategy> team;
    std::vector<FieldStrategy> pmr;
    std::vector<FieldStrategy> fpts;
    std::vector<std::string> unitLabels;   // stripped before numeric parsing

    // The virtualized contest standings table.
    static ExtractionProfile contestStandings();

    // Replaces strategy lists from "extract.<field> = sel | sel@attr | ..."
    // and "extract.team.strip_prefix". Returns the number of fields overridden.
    int applyOverrides(const Configuration& config);

    static std::vector<FieldStrategy> parseStrategyList(const std::string& field, const std::string& spec);
};
