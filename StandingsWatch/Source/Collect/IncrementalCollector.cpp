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

#include "IncrementalCollector.h"
#include "../Browser/IBrowserSession.h"
#include "../Database/Configuration.h"
#include "../Database/GlobalOpts.h"
#include "../Extract/SnapshotExtractor.h"
#include "../Utility/Errors.h"
#include "../Utility/Log.h"
#include <string>
#include <thread>
#include <unordered_set>

IncrementalCollector::Options IncrementalCollector::Options::LoadFrom(const Configuration& config)
{
    Options out;
    int settleMs = static_cast<int>(out.settleDelay.count());
    if (config.getProperty(OPTION_COLLECTORSETTLEMS, settleMs) && settleMs >= 0) {
        out.settleDelay = std::chrono::milliseconds(settleMs);
    }
    int maxIterations = out.maxIterations;
    if (config.getProperty(OPTION_COLLECTORMAXITERATIONS, maxIterations) && maxIterations > 0) {
        out.maxIterations = maxIterations;
    }
    return out;
}

IncrementalCollector::IncrementalCollector(IBrowserSession& session, const SnapshotExtractor& extractor, const Options& options)
    : session_(session)
    , extractor_(extractor)
    , options_(options)
{
}

std::vector<StandingsRow> IncrementalCollector::collectRows()
{
    const std::string& container = extractor_.profile().containerSelector;
    const std::string& rowSelector = extractor_.profile().rowSelector;

    std::unordered_set<std::string> seen;
    std::vector<StandingsRow> result;
    long long previousSize = -1;
    int unnamed = 0;
    lastIterations_ = 0;

    for (;;) {
        if (lastIterations_ >= options_.maxIterations) {
            throw StabilizationTimeout("standings did not stabilize after " +
                std::to_string(options_.maxIterations) + " passes (" +
                std::to_string(result.size()) + " teams so far)");
        }
        lastIterations_++;

        std::vector<StandingsRow> mounted = extractor_.extract(session_.mountedMarkup(container));
        for (auto& row : mounted) {
            if (!row.teamName) {
                unnamed++;
                continue;
            }
            if (seen.insert(*row.teamName).second) {
                result.push_back(row);
            }
        }

        if (static_cast<long long>(result.size()) == previousSize) {
            break;
        }
        previousSize = static_cast<long long>(result.size());

        // Nothing mounted means nothing to scroll to
        if (mounted.empty() || !session_.scrollLastIntoView(rowSelector)) {
            break;
        }
        if (settleWait_) {
            if (!settleWait_(options_.settleDelay)) {
                LOG_INFO("Collector", "Stop requested after " << lastIterations_ << " passes, abandoning collection");
                throw CollectionCancelled("collection cancelled after " + std::to_string(lastIterations_) + " passes");
            }
        }
        else if (options_.settleDelay.count() > 0) {
            std::this_thread::sleep_for(options_.settleDelay);
        }
    }

    if (unnamed > 0) {
        LOG_DEBUG("Collector", "Skipped " << unnamed << " mounted rows without a team identity");
    }
    LOG_INFO("Collector", "Collected " << result.size() << " teams in " << lastIterations_ << " passes");
    return result;
}

StandingsSnapshot IncrementalCollector::collect(long long timeIndex)
{
    return StandingsSnapshot(timeIndex, collectRows());
}
