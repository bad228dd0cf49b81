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

#include "ExtractionProfile.h"
#include "../Database/Configuration.h"
#include "../Database/GlobalOpts.h"
#include "../Utility/Log.h"
#include "../Utility/Utils.h"

ExtractionProfile ExtractionProfile::contestStandings()
{
    ExtractionProfile p;
    p.containerSelector = ".ReactVirtualized__Table.ContestStandings_contest-standings-table";
    p.rowSelector = ".ReactVirtualized__Table__row.ContestStandings_row";

    p.rank = {
        { "rank-cell", ".ContestStandings_rank-cell", "", "" },
    };
    p.team = {
        { "aria-label", "", "aria-label", "view standings for " },
        { "team-name-cell", ".UsernameWithEntryIndex_team-name", "", "" },
    };
    p.pmr = {
        { "time-remaining-cell", ".column-timeRemaining [role=\"cell\"] span", "", "" },
        { "time-remaining-column", ".column-timeRemaining span", "", "" },
    };
    p.fpts = {
        { "points-cell-animated", ".ContestStandings_fantasy-points-cell .AnimatedNumber_animated-number span", "", "" },
        { "points-column-animated", ".ContestStandings_column-fantasyPoints .AnimatedNumber_animated-number span", "", "" },
        { "points-cell", ".ContestStandings_fantasy-points-cell", "", "" },
        { "points-column", ".ContestStandings_column-fantasyPoints", "", "" },
    };
    p.unitLabels = { "FPTS" };
    return p;
}

std::vector<FieldStrategy> ExtractionProfile::parseStrategyList(const std::string& field, const std::string& spec)
{
    std::vector<std::string> parts;
    Utils::listToVector(spec, parts, '|');

    std::vector<FieldStrategy> out;
    for (const auto& part : parts) {
        FieldStrategy s;
        s.name = field + "#" + std::to_string(out.size() + 1);

        // "selector@attr" reads an attribute; a bare "@attr" reads it off the row
        size_t at = part.rfind('@');
        if (at != std::string::npos) {
            s.selector = part.substr(0, at);
            s.attribute = part.substr(at + 1);
            s.selector = Utils::trim(s.selector);
            s.attribute = Utils::trim(s.attribute);
        }
        else {
            s.selector = part;
        }
        out.push_back(s);
    }
    return out;
}

int ExtractionProfile::applyOverrides(const Configuration& config)
{
    int overridden = 0;
    auto apply = [&](const char* field, std::vector<FieldStrategy>& target) {
        std::string spec;
        if (!config.getProperty(std::string(OPTION_EXTRACTPREFIX) + "." + field, spec)) return;
        std::vector<FieldStrategy> parsed = parseStrategyList(field, spec);
        if (parsed.empty()) {
            LOG_WARNING("Extract", "Ignoring empty strategy list for " << field);
            return;
        }
        target = parsed;
        overridden++;
        LOG_INFO("Extract", "Using " << parsed.size() << " configured strategies for " << field);
    };

    apply("rank", rank);
    apply("team", team);
    apply("pmr", pmr);
    apply("fpts", fpts);

    std::string prefix;
    if (config.getProperty(std::string(OPTION_EXTRACTPREFIX) + ".team.strip_prefix", prefix)) {
        for (auto& s : team) {
            if (!s.attribute.empty()) s.stripPrefix = prefix;
        }
    }

    config.getProperty(std::string(OPTION_EXTRACTPREFIX) + ".rows", rowSelector);
    config.getProperty(std::string(OPTION_EXTRACTPREFIX) + ".container", containerSelector);
    return overridden;
}
