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
#include "ProjectionEngine.h"
#include "../Database/Configuration.h"
#include "../Database/GlobalOpts.h"
#include "../Standings/StandingsSnapshot.h"
#include "../Utility/Errors.h"
#include "../Utility/Log.h"
#include "../Utility/ThreadPool.h"
#include <algorithm>
#include <cmath>
#include <future>
#include <limits>
#include <random>

ProjectionParams ProjectionParams::LoadFrom(const Configuration& config)
{
    ProjectionParams out;
    config.getProperty(OPTION_PROJECTIONSIGMA2, out.sigma2);
    config.getProperty(OPTION_PROJECTIONRATE, out.scoringRatePerMinute);
    config.getProperty(OPTION_PROJECTIONSIMS, out.sims);

    std::string seed;
    if (config.getProperty(OPTION_PROJECTIONSEED, seed) && !seed.empty()) {
        try {
            out.seed = std::stoull(seed);
        }
        catch (const std::exception&) {
            LOG_WARNING("Projection", "Ignoring invalid " << OPTION_PROJECTIONSEED << ": \"" << seed << "\"");
        }
    }

    int threads = 0;
    if (config.getProperty(OPTION_PROJECTIONTHREADS, threads) && threads > 0) {
        out.threads = static_cast<size_t>(threads);
    }
    return out;
}

ProjectionEngine::ProjectionEngine(const ProjectionParams& params)
    : params_(params)
    , pool_(std::make_unique<ThreadPool>(params.threads > 0 ? params.threads : ThreadPool::defaultSize(), "standings:mc"))
{
}

ProjectionEngine::~ProjectionEngine() = default;

void ProjectionEngine::validate_(const std::vector<ProjectionResult>& teams) const
{
    if (!std::isfinite(params_.sigma2) || params_.sigma2 < 0) {
        throw ProjectionError("sigma2 must be a finite, non-negative number");
    }
    if (!std::isfinite(params_.scoringRatePerMinute) || params_.scoringRatePerMinute < 0) {
        throw ProjectionError("scoring rate must be a finite, non-negative number");
    }
    if (params_.sims <= 0) {
        throw ProjectionError("sims must be positive");
    }
    if (params_.blockSize <= 0) {
        throw ProjectionError("block size must be positive");
    }
    for (const auto& team : teams) {
        if (!std::isfinite(team.fpts)) {
            throw ProjectionError("non-finite fpts for " + team.teamName);
        }
        if (team.pmr < 0) {
            throw ProjectionError("negative pmr for " + team.teamName);
        }
    }
}

std::vector<long long> ProjectionEngine::simulateBlock_(const std::vector<Team>& teams, std::uint64_t seed,
    std::uint64_t block, int trials)
{
    const size_t n = teams.size();
    std::vector<long long> wins(n, 0);

    // Only teams with spread draw random numbers
    std::vector<std::mt19937_64> engines;
    std::vector<std::normal_distribution<double>> normals;
    std::vector<int> streamOf(n, -1);
    for (size_t i = 0; i < n; ++i) {
        if (teams[i].stdDev > 0) {
            std::seed_seq seq{
                static_cast<std::uint32_t>(seed & 0xffffffffu),
                static_cast<std::uint32_t>(seed >> 32),
                static_cast<std::uint32_t>(block),
                static_cast<std::uint32_t>(i) };
            streamOf[i] = static_cast<int>(engines.size());
            engines.emplace_back(seq);
            normals.emplace_back(0.0, 1.0);
        }
    }

    for (int t = 0; t < trials; ++t) {
        double best = -std::numeric_limits<double>::infinity();
        size_t winner = 0;
        for (size_t i = 0; i < n; ++i) {
            double value = teams[i].mean;
            int s = streamOf[i];
            if (s >= 0) {
                value += teams[i].stdDev * normals[s](engines[s]);
            }
            if (value > best) {
                best = value;
                winner = i;
            }
        }
        wins[winner]++;
    }
    return wins;
}

Projection ProjectionEngine::project(const StandingsSnapshot& snapshot) const
{
    Projection projection;
    projection.timeIndex = snapshot.timeIndex();
    projection.sims = params_.sims;

    for (const auto& row : snapshot.entries()) {
        if (!row.fpts || !row.pmr) {
            projection.excluded.push_back(row.teamName.value_or(""));
            continue;
        }
        ProjectionResult result;
        result.teamName = row.teamName.value_or("");
        result.fpts = *row.fpts;
        result.pmr = *row.pmr;
        projection.results.push_back(result);
    }
    if (!projection.excluded.empty()) {
        LOG_INFO("Projection", projection.excluded.size() << " entries lack fpts or pmr and are not simulated");
    }

    try {
        validate_(projection.results);
    }
    catch (const ProjectionError& e) {
        LOG_WARNING("Projection", "Degraded projection for time index " << projection.timeIndex << ": " << e.what());
        projection.degraded = true;
        projection.degradedReason = e.what();
        for (auto& result : projection.results) {
            result.projectedFinal = result.fpts;
            result.stdDev = 0;
            result.winProbability = 0;
        }
        return projection;
    }

    if (projection.results.empty()) {
        return projection;
    }

    auto teams = std::make_shared<std::vector<Team>>();
    teams->reserve(projection.results.size());
    for (auto& result : projection.results) {
        result.projectedFinal = result.fpts + params_.scoringRatePerMinute * result.pmr;
        result.stdDev = std::sqrt(params_.sigma2 * result.pmr);
        teams->push_back(Team{ result.projectedFinal, result.stdDev });
    }

    std::uint64_t seed = 0;
    if (params_.seed) {
        seed = *params_.seed;
    }
    else {
        std::random_device rd;
        seed = (static_cast<std::uint64_t>(rd()) << 32) ^ rd();
    }
    projection.seed = seed;

    const int blockSize = params_.blockSize;
    const int blocks = (params_.sims + blockSize - 1) / blockSize;
    std::vector<std::future<std::vector<long long>>> pending;
    pending.reserve(blocks);
    for (int b = 0; b < blocks; ++b) {
        int trials = std::min(blockSize, params_.sims - b * blockSize);
        pending.push_back(pool_->enqueue([teams, seed, b, trials]() {
            return simulateBlock_(*teams, seed, static_cast<std::uint64_t>(b), trials);
        }));
    }

    std::vector<long long> wins(teams->size(), 0);
    for (auto& f : pending) {
        std::vector<long long> blockWins = f.get();
        for (size_t i = 0; i < wins.size(); ++i) {
            wins[i] += blockWins[i];
        }
    }

    for (size_t i = 0; i < wins.size(); ++i) {
        projection.results[i].winProbability = static_cast<double>(wins[i]) / params_.sims;
    }

    LOG_DEBUG("Projection", "Simulated " << params_.sims << " trials for " << teams->size()
        << " teams in " << blocks << " blocks, seed " << seed);
    return projection;
}
