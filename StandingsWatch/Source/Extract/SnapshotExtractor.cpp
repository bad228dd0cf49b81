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

#include "SnapshotExtractor.h"
#include "../Utility/Errors.h"
#include "../Utility/Log.h"
#include "../Utility/Utils.h"
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

SnapshotExtractor::SnapshotExtractor(const ExtractionProfile& profile)
    : profile_(profile)
{
    try {
        rowSelector_ = MarkupSelector::parse(profile_.rowSelector);
    }
    catch (const std::invalid_argument& e) {
        throw ConfigError(std::string("row selector: ") + e.what());
    }
    if (rowSelector_.empty()) {
        throw ConfigError("row selector is empty");
    }

    rank_ = compile(profile_.rank);
    team_ = compile(profile_.team);
    pmr_ = compile(profile_.pmr);
    fpts_ = compile(profile_.fpts);
}

SnapshotExtractor::StrategyList SnapshotExtractor::compile(const std::vector<FieldStrategy>& strategies)
{
    StrategyList out;
    out.reserve(strategies.size());
    for (const auto& s : strategies) {
        CompiledStrategy c;
        c.spec = s;
        try {
            c.selector = MarkupSelector::parse(s.selector);
        }
        catch (const std::invalid_argument& e) {
            throw ConfigError("strategy " + s.name + ": " + e.what());
        }
        out.push_back(std::move(c));
    }
    return out;
}

std::optional<std::string> SnapshotExtractor::resolve(const MarkupSelector::Node* row, const StrategyList& strategies)
{
    for (const auto& strategy : strategies) {
        const MarkupSelector::Node* node = strategy.selector.empty() ? row : strategy.selector.selectFirst(row);
        if (!node) continue;

        std::string value;
        if (strategy.spec.attribute.empty()) {
            value = MarkupSelector::textOf(node);
        }
        else {
            std::optional<std::string> attr = MarkupSelector::attributeOf(node, strategy.spec.attribute);
            if (!attr) continue;
            value = *attr;
        }
        value = Utils::trim(value);

        if (!strategy.spec.stripPrefix.empty()) {
            std::string prefix = strategy.spec.stripPrefix;
            prefix = Utils::trim(prefix);
            if (!Utils::startsWith(value, prefix)) continue;
            value = value.substr(prefix.size());
            value = Utils::trim(value);
        }

        if (!value.empty()) {
            return value;
        }
    }
    return std::nullopt;
}

std::vector<StandingsRow> SnapshotExtractor::extract(const std::string& markup) const
{
    std::vector<StandingsRow> rows;
    if (markup.empty()) {
        return rows;
    }

    // rapidxml parses in place and needs a terminated mutable buffer
    std::vector<char> buffer(markup.begin(), markup.end());
    buffer.push_back('\0');

    rapidxml::xml_document<> doc;
    try {
        doc.parse<0>(buffer.data());
    }
    catch (const rapidxml::parse_error& e) {
        LOG_WARNING("Extract", "Markup parse error: " << e.what());
        return rows;
    }

    int gaps = 0;
    for (const MarkupSelector::Node* rowNode : rowSelector_.selectAll(&doc)) {
        StandingsRow row;
        if (auto text = resolve(rowNode, rank_)) row.rank = parseInteger(*text, profile_.unitLabels);
        if (auto text = resolve(rowNode, team_)) row.teamName = *text;
        if (auto text = resolve(rowNode, pmr_)) row.pmr = parseInteger(*text, profile_.unitLabels);
        if (auto text = resolve(rowNode, fpts_)) row.fpts = parseNumber(*text, profile_.unitLabels);

        if (row.pmr && *row.pmr < 0) {
            row.pmr.reset();
        }

        if (!row.hasAnyField()) {
            continue;
        }
        if (!row.rank || !row.teamName || !row.pmr || !row.fpts) {
            gaps++;
        }
        rows.push_back(std::move(row));
    }

    if (gaps > 0) {
        LOG_DEBUG("Extract", gaps << " of " << rows.size() << " rows have unresolved fields");
    }
    return rows;
}

std::optional<double> SnapshotExtractor::parseNumber(const std::string& text, const std::vector<std::string>& unitLabels)
{
    std::string s = Utils::replace(text, ",", "");
    for (const auto& label : unitLabels) {
        s = Utils::replace(s, label, "");
    }

    auto isDigit = [&s](size_t i) { return i < s.size() && std::isdigit(static_cast<unsigned char>(s[i])); };

    for (size_t i = 0; i < s.size(); ++i) {
        size_t j = i;
        if (s[j] == '-' || s[j] == '+') ++j;

        size_t intEnd = j;
        while (isDigit(intEnd)) ++intEnd;

        size_t end = intEnd;
        if (end < s.size() && s[end] == '.' && isDigit(end + 1)) {
            ++end;
            while (isDigit(end)) ++end;
        }
        else if (intEnd == j) {
            continue;
        }

        std::string token = s.substr(i, end - i);
        double value = std::strtod(token.c_str(), nullptr);
        if (!std::isfinite(value)) {
            return std::nullopt;
        }
        return value;
    }
    return std::nullopt;
}

std::optional<int> SnapshotExtractor::parseInteger(const std::string& text, const std::vector<std::string>& unitLabels)
{
    std::optional<double> value = parseNumber(text, unitLabels);
    if (!value || std::fabs(*value) > 2147483647.0) {
        return std::nullopt;
    }
    return static_cast<int>(*value);
}
