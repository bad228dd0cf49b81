#pragma once

#include <optional>
#include <string>
#include <vector>

#include "ProjectionEngine.h"

class SnapshotHistory;

// What a dashboard shows: one snapshot's projection ordered by projected final.
class ProjectionReport {
public:
    explicit ProjectionReport(const Projection& projection);

    // Projects the newest snapshot of the history. Empty when there is none.
    static std::optional<ProjectionReport> latest(const SnapshotHistory& history, const ProjectionEngine& engine);

    long long timeIndex() const { return projection_.timeIndex; }
    bool degraded() const { return projection_.degraded; }
    const Projection& projection() const { return projection_; }

    // Projected final descending; equal projections keep snapshot order.
    const std::vector<ProjectionResult>& rows() const { return rows_; }

    std::string toText() const;
    std::string toJson(int indent = 2) const;

private:
    Projection projection_;
    std::vector<ProjectionResult> rows_;
};
