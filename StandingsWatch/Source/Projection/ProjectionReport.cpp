#include "ProjectionReport.h"
#include "../Persist/SnapshotHistory.h"
#include <algorithm>
#include <cstdio>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

// Team names can be any length, so they are padded outside the fixed-size buffers.
std::string padRight(const std::string& text, size_t width)
{
    return text.size() >= width ? text : text + std::string(width - text.size(), ' ');
}

}

ProjectionReport::ProjectionReport(const Projection& projection)
    : projection_(projection)
    , rows_(projection.results)
{
    std::stable_sort(rows_.begin(), rows_.end(), [](const ProjectionResult& a, const ProjectionResult& b) {
        return a.projectedFinal > b.projectedFinal;
    });
}

std::optional<ProjectionReport> ProjectionReport::latest(const SnapshotHistory& history, const ProjectionEngine& engine)
{
    const StandingsSnapshot* snapshot = history.latest();
    if (!snapshot) {
        return std::nullopt;
    }
    return ProjectionReport(engine.project(*snapshot));
}

std::string ProjectionReport::toText() const
{
    size_t teamWidth = 4;
    for (const auto& row : rows_) {
        teamWidth = std::max(teamWidth, row.teamName.size());
    }

    std::string out = "Projected standings at time index " + std::to_string(projection_.timeIndex);
    if (projection_.degraded) {
        out += " [DEGRADED: " + projection_.degradedReason + "]";
    }
    out += "\n";

    char numbers[1024];
    std::snprintf(numbers, sizeof(numbers), "  %12s  %15s  %15s\n", "Current FPTS", "Projected Final", "Win Probability");
    out += "   #  " + padRight(std::string("Team"), teamWidth) + numbers;

    int position = 1;
    for (const auto& row : rows_) {
        char rank[16];
        std::snprintf(rank, sizeof(rank), "%4d  ", position++);
        std::snprintf(numbers, sizeof(numbers), "  %12.1f  %15.1f  %14.1f%%\n",
            row.fpts, row.projectedFinal, row.winProbability * 100.0);
        out += rank + padRight(row.teamName, teamWidth) + numbers;
    }

    if (!projection_.excluded.empty()) {
        out += std::to_string(projection_.excluded.size()) + " entries without points or minutes remaining were left out\n";
    }
    return out;
}

std::string ProjectionReport::toJson(int indent) const
{
    json root;
    root["timeIndex"] = projection_.timeIndex;
    root["degraded"] = projection_.degraded;
    if (projection_.degraded) {
        root["degradedReason"] = projection_.degradedReason;
    }
    root["sims"] = projection_.sims;

    auto& rows = root["rows"] = json::array();
    int position = 1;
    for (const auto& row : rows_) {
        json r;
        r["position"] = position++;
        r["team"] = row.teamName;
        r["fpts"] = row.fpts;
        r["pmr"] = row.pmr;
        r["projectedFinal"] = row.projectedFinal;
        r["stdDev"] = row.stdDev;
        r["winProbability"] = row.winProbability;
        rows.push_back(r);
    }
    root["excluded"] = projection_.excluded;
    return root.dump(indent, ' ', false, json::error_handler_t::replace);
}
