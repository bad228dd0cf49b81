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

#include "ExtractionProfile.h"
#include "MarkupSelector.h"
#include "../Standings/StandingsSnapshot.h"

/**
 * @brief Turns serialized standings markup into rows. No I/O, no side effects.
 *
 * Each field is resolved by its ordered strategy list; the first strategy that
 * produces non-empty text wins. Rows with no resolved field are dropped.
 */
class SnapshotExtractor {
public:
    // Throws ConfigError if a profile selector does not parse.
    explicit SnapshotExtractor(const ExtractionProfile& profile = ExtractionProfile::contestStandings());

    // Malformed markup logs a warning and yields no rows.
    std::vector<StandingsRow> extract(const std::string& markup) const;

    const ExtractionProfile& profile() const { return profile_; }

    // First signed decimal token after removing ',' and unit labels.
    static std::optional<double> parseNumber(const std::string& text,
        const std::vector<std::string>& unitLabels = {});
    // Integer part of parseNumber.
    static std::optional<int> parseInteger(const std::string& text,
        const std::vector<std::string>& unitLabels = {});

private:
    struct CompiledStrategy {
        FieldStrategy spec;
        MarkupSelector selector;
    };
    typedef std::vector<CompiledStrategy> StrategyList;

    static StrategyList compile(const std::vector<FieldStrategy>& strategies);
    static std::optional<std::string> resolve(const MarkupSelector::Node* row, const StrategyList& strategies);

    ExtractionProfile profile_;
    MarkupSelector rowSelector_;
    StrategyList rank_;
    StrategyList team_;
    StrategyList pmr_;
    StrategyList fpts_;
};
