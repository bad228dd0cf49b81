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
#include <functional>
#include <vector>

#include "../Standings/StandingsSnapshot.h"

class Configuration;
class IBrowserSession;
class SnapshotExtractor;

/**
 * @brief Rebuilds the whole leaderboard from a view that only mounts visible rows.
 *
 * Reads the mounted rows, keeps those whose team identity is new, scrolls the
 * last mounted row into view and waits for the list to settle, until a pass
 * adds nothing. Rows are identified by team name, never by DOM position.
 */
class IncrementalCollector {
public:
    struct Options {
        std::chrono::milliseconds settleDelay{ 500 };
        int maxIterations = 1000;

        static Options LoadFrom(const Configuration& config);
    };

    // Waits out a settle delay. Returns false when the wait was cut short by a stop.
    typedef std::function<bool(std::chrono::milliseconds)> SettleWait;

    IncrementalCollector(IBrowserSession& session, const SnapshotExtractor& extractor, const Options& options);

    // Replaces the plain sleep between passes. CollectionCancelled is thrown
    // when the wait reports a stop.
    void setSettleWait(SettleWait wait) { settleWait_ = wait; }

    // First-seen order. Throws StabilizationTimeout past maxIterations and
    // CollectionCancelled when the settle wait is interrupted.
    std::vector<StandingsRow> collectRows();

    StandingsSnapshot collect(long long timeIndex);

    // Read passes used by the last collect.
    int lastIterations() const { return lastIterations_; }

private:
    IBrowserSession& session_;
    const SnapshotExtractor& extractor_;
    Options options_;
    SettleWait settleWait_;
    int lastIterations_ = 0;
};
