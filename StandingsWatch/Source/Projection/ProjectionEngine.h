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

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class Configuration;
class StandingsSnapshot;
class ThreadPool;

struct ProjectionParams {
    double sigma2 = 0.5;                 // variance added per remaining player minute
    double scoringRatePerMinute = 0.25;  // expected points per remaining player minute
    int sims = 20000;
    std::optional<std::uint64_t> seed;   // random device when unset
    int blockSize = 1024;                // trials per parallel work item
    size_t threads = 0;                  // 0 = ThreadPool::defaultSize()

    static ProjectionParams LoadFrom(const Configuration& config);
};

struct ProjectionResult {
    std::string teamName;
    double fpts = 0;
    int pmr = 0;
    double projectedFinal = 0;
    double stdDev = 0;
    double winProbability = 0;
};

struct Projection {
    long long timeIndex = 0;
    std::vector<ProjectionResult> results;   // snapshot order
    std::vector<std::string> excluded;       // rows without fpts or pmr
    bool degraded = false;
    std::string degradedReason;
    int sims = 0;
    std::uint64_t seed = 0;
};

/**
 * @brief Monte Carlo estimate of final scores and win chances for one snapshot.
 *
 * Final score of a team ~ Normal(fpts + rate * pmr, sigma2 * pmr). Each trial
 * draws one score per team; the highest wins, the lower index on a tie.
 * Trials are split into blocks and every (block, team) pair has its own
 * engine seeded from (seed, block, team), so the result is the same for any
 * thread count.
 */
class ProjectionEngine {
public:
    explicit ProjectionEngine(const ProjectionParams& params = ProjectionParams());
    ~ProjectionEngine();

    ProjectionEngine(const ProjectionEngine&) = delete;
    ProjectionEngine& operator=(const ProjectionEngine&) = delete;

    // Never throws ProjectionError: invalid input yields a degraded projection
    // with projectedFinal = fpts and winProbability = 0.
    Projection project(const StandingsSnapshot& snapshot) const;

    const ProjectionParams& params() const { return params_; }

private:
    struct Team {
        double mean;
        double stdDev;
    };

    void validate_(const std::vector<ProjectionResult>& teams) const;
    static std::vector<long long> simulateBlock_(const std::vector<Team>& teams, std::uint64_t seed,
        std::uint64_t block, int trials);

    ProjectionParams params_;
    std::unique_ptr<ThreadPool> pool_;
};
