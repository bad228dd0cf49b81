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
#include "PollScheduler.h"
#include "../Browser/IBrowserSession.h"
#include "../Database/Configuration.h"
#include "../Database/GlobalOpts.h"
#include "../Extract/SnapshotExtractor.h"
#include "../Persist/ISnapshotSink.h"
#include "../Utility/Errors.h"
#include "../Utility/Log.h"
#include "../Utility/Utils.h"
#include <algorithm>
#include <fstream>
#include <iostream>

namespace {

std::chrono::milliseconds secondsOption(const Configuration& config, const char* key, std::chrono::milliseconds fallback)
{
    double seconds = 0;
    if (config.getProperty(key, seconds) && seconds >= 0) {
        return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
    }
    return fallback;
}

}

SchedulerConfig SchedulerConfig::LoadFrom(const Configuration& config)
{
    SchedulerConfig out;
    out.targetFile = Configuration::convertToAbsolutePath(Configuration::absolutePath, out.targetFile);
    out.authFile = Configuration::convertToAbsolutePath(Configuration::absolutePath, out.authFile);
    config.getPropertyAbsolutePath(OPTION_TARGETFILE, out.targetFile);
    config.getPropertyAbsolutePath(OPTION_AUTHFILE, out.authFile);
    config.getProperty(OPTION_HOMEURL, out.homeUrl);

    out.pollInterval = secondsOption(config, OPTION_POLLINTERVALSECONDS, out.pollInterval);
    out.refreshSettle = secondsOption(config, OPTION_REFRESHSETTLESECONDS, out.refreshSettle);
    out.backoff = secondsOption(config, OPTION_BACKOFFSECONDS, out.backoff);
    out.pageSettle = secondsOption(config, OPTION_PAGESETTLESECONDS, out.pageSettle);
    out.readyTimeout = secondsOption(config, OPTION_READYTIMEOUTSECONDS, out.readyTimeout);

    int tickMs = static_cast<int>(out.tick.count());
    if (config.getProperty(OPTION_TICKMS, tickMs) && tickMs > 0) {
        out.tick = std::chrono::milliseconds(tickMs);
    }

    out.collector = IncrementalCollector::Options::LoadFrom(config);
    return out;
}

PollScheduler::PollScheduler(std::unique_ptr<IBrowserSession> session,
    const SnapshotExtractor& extractor,
    ISnapshotSink& sink,
    const SchedulerConfig& config)
    : session_(std::move(session))
    , extractor_(extractor)
    , sink_(sink)
    , config_(config)
    , authStore_(config.authFile)
    , collector_(*session_, extractor, config.collector)
{
    if (config_.tick.count() <= 0) {
        config_.tick = std::chrono::milliseconds(1);
    }
    collector_.setSettleWait([this](std::chrono::milliseconds delay) { return sleepFor_(delay); });
}

PollScheduler::~PollScheduler()
{
    stop();
    close();
}

std::string PollScheduler::stateToString(SchedulerState state)
{
    switch (state) {
        case SchedulerState::UNINITIALIZED: return "UNINITIALIZED";
        case SchedulerState::AUTHENTICATING: return "AUTHENTICATING";
        case SchedulerState::READY: return "READY";
        case SchedulerState::POLLING: return "POLLING";
        case SchedulerState::REFRESHING: return "REFRESHING";
        case SchedulerState::ERROR: return "ERROR";
        case SchedulerState::RETRY_BACKOFF: return "RETRY_BACKOFF";
        case SchedulerState::CLOSED: return "CLOSED";
        default: return "UNKNOWN";
    }
}

std::string PollScheduler::readTarget(const std::string& path)
{
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("target file not found: " + path);
    }
    std::string line;
    if (!std::getline(in, line)) {
        throw ConfigError("target file is empty: " + path);
    }
    if (line.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        line.erase(0, 3);
    }
    Utils::trim(line);
    if (line.empty()) {
        throw ConfigError("first line of " + path + " does not name a contest URL");
    }
    return line;
}

PollScheduler::LoginPrompt PollScheduler::consoleLoginPrompt()
{
    return [](IBrowserSession&, const std::string& loginUrl) {
        std::cout << "No saved login found. Log in at " << loginUrl
            << " in the browser window, then press Enter here to continue..." << std::endl;
        std::string ignored;
        std::getline(std::cin, ignored);
    };
}

void PollScheduler::start()
{
    if (worker_.joinable()) {
        LOG_WARNING("Scheduler", "Already running");
        return;
    }
    worker_ = std::thread([this]() { run(); });
}

void PollScheduler::stop()
{
    {
        std::lock_guard<std::mutex> lock(stopMutex_);
        stopRequested_ = true;
    }
    stopCondition_.notify_all();

    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
}

void PollScheduler::run()
{
    try {
        if (initialize_()) {
            while (!stopRequested() && cycle_()) {
            }
        }
    }
    catch (const ConfigError& e) {
        recordError_(e.what());
        LOG_ERROR("Scheduler", "Configuration error, not starting: " << e.what());
    }
    catch (const SessionFatal& e) {
        recordError_(e.what());
        LOG_ERROR("Scheduler", "Browser session lost: " << e.what());
    }
    catch (const std::exception& e) {
        recordError_(e.what());
        LOG_ERROR("Scheduler", "Unexpected failure: " << e.what());
    }

    if (stopRequested()) {
        LOG_INFO("Scheduler", "Stop requested, shutting down");
    }
    close();
}

bool PollScheduler::runOnce()
{
    bool ok = false;
    try {
        if (initialize_()) {
            setState_(SchedulerState::POLLING);
            pollOnce_();
            ok = true;
        }
    }
    catch (const CollectionCancelled& e) {
        LOG_INFO("Scheduler", "Single collection stopped: " << e.what());
    }
    catch (const std::exception& e) {
        recordError_(e.what());
        LOG_ERROR("Scheduler", "Single collection failed: " << e.what());
    }
    close();
    return ok;
}

SchedulerStatus PollScheduler::status() const
{
    std::lock_guard<std::mutex> lock(statusMutex_);
    return status_;
}

void PollScheduler::close()
{
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        stop();
    }
    {
        std::lock_guard<std::mutex> lock(closeMutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
    }

    try {
        if (session_) {
            session_->close();
        }
    }
    catch (const std::exception& e) {
        LOG_ERROR("Scheduler", "Releasing the browser session failed: " << e.what());
    }
    setState_(SchedulerState::CLOSED);
}

bool PollScheduler::initialize_()
{
    targetUrl_ = readTarget(config_.targetFile);
    LOG_INFO("Scheduler", "Target contest: " << targetUrl_);

    const std::string& container = extractor_.profile().containerSelector;

    while (!stopRequested()) {
        setState_(SchedulerState::AUTHENTICATING);
        try {
            if (!session_->isOpen()) {
                session_->open();
            }
            authenticate_();

            session_->navigate(targetUrl_);
            if (!sleepFor_(config_.pageSettle)) {
                return false;
            }
            if (!session_->waitForSelector(container, config_.readyTimeout)) {
                throw TransientPollError("standings table did not appear within " +
                    std::to_string(config_.readyTimeout.count()) + " ms");
            }
            setState_(SchedulerState::READY);
            return true;
        }
        catch (const SessionFatal&) {
            throw;
        }
        catch (const ConfigError&) {
            throw;
        }
        catch (const std::exception& e) {
            if (!backoff_(e.what())) {
                return false;
            }
        }
    }
    return false;
}

void PollScheduler::authenticate_()
{
    session_->navigate(config_.homeUrl);

    std::string state;
    if (authStore_.load(state) && !state.empty()) {
        try {
            session_->importAuthState(state);
            LOG_INFO("Scheduler", "Reusing saved login from " << authStore_.path());
            return;
        }
        catch (const TransientPollError& e) {
            LOG_WARNING("Scheduler", "Saved login in " << authStore_.path() << " is unusable (" << e.what() << ")");
        }
    }

    LOG_NOTICE("Scheduler", "Waiting for interactive login");
    LoginPrompt prompt = loginPrompt_ ? loginPrompt_ : consoleLoginPrompt();
    prompt(*session_, config_.homeUrl);

    if (authStore_.save(session_->exportAuthState())) {
        LOG_INFO("Scheduler", "Saved login to " << authStore_.path());
    }
    else {
        LOG_WARNING("Scheduler", "Could not save login to " << authStore_.path() << ", next run will ask again");
    }
}

void PollScheduler::pollOnce_()
{
    std::chrono::system_clock::time_point now = std::chrono::system_clock::now();
    long long timeIndex = nextTimeIndex_(now);

    StandingsSnapshot snapshot = collector_.collect(timeIndex);
    if (snapshot.empty()) {
        LOG_WARNING("Scheduler", "Collected an empty leaderboard at time index " << timeIndex);
    }
    std::string path = sink_.persist(snapshot, now);

    std::lock_guard<std::mutex> lock(statusMutex_);
    status_.lastSuccessfulPoll = now;
    status_.consecutiveFailures = 0;
    status_.lastSnapshotPath = path;
    status_.lastTimeIndex = timeIndex;
    status_.totalPolls++;
}

bool PollScheduler::cycle_()
{
    try {
        setState_(SchedulerState::POLLING);
        pollOnce_();
        if (!sleepFor_(config_.pollInterval)) {
            return false;
        }

        setState_(SchedulerState::REFRESHING);
        session_->reload();
        return sleepFor_(config_.refreshSettle);
    }
    catch (const SessionFatal&) {
        throw;
    }
    catch (const CollectionCancelled&) {
        return false;
    }
    catch (const std::exception& e) {
        return backoff_(e.what());
    }
}

bool PollScheduler::backoff_(const std::string& error)
{
    int failures = 0;
    {
        std::lock_guard<std::mutex> lock(statusMutex_);
        failures = ++status_.consecutiveFailures;
        status_.lastError = error;
    }
    setState_(SchedulerState::ERROR);
    LOG_ERROR("Scheduler", "Poll failed (" << failures << " in a row): " << error);

    setState_(SchedulerState::RETRY_BACKOFF);
    LOG_INFO("Scheduler", "Retrying in " << config_.backoff.count() << " ms");
    return sleepFor_(config_.backoff);
}

void PollScheduler::recordError_(const std::string& error)
{
    {
        std::lock_guard<std::mutex> lock(statusMutex_);
        status_.lastError = error;
    }
    setState_(SchedulerState::ERROR);
}

bool PollScheduler::sleepFor_(std::chrono::milliseconds duration)
{
    const auto deadline = std::chrono::steady_clock::now() + duration;
    std::unique_lock<std::mutex> lock(stopMutex_);
    while (!stopRequested_) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return true;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now) + std::chrono::milliseconds(1);
        stopCondition_.wait_for(lock, std::min(config_.tick, remaining));
    }
    return false;
}

void PollScheduler::setState_(SchedulerState newState)
{
    SchedulerState oldState;
    {
        std::lock_guard<std::mutex> lock(statusMutex_);
        oldState = status_.state;
        if (oldState == newState) {
            return;
        }
        status_.state = newState;
    }
    LOG_INFO("Scheduler", "State change: " << stateToString(oldState) << " -> " << stateToString(newState));
}

long long PollScheduler::nextTimeIndex_(std::chrono::system_clock::time_point now)
{
    long long minutes = std::chrono::duration_cast<std::chrono::minutes>(now.time_since_epoch()).count();
    std::lock_guard<std::mutex> lock(statusMutex_);
    if (status_.totalPolls > 0 && minutes <= status_.lastTimeIndex) {
        minutes = status_.lastTimeIndex + 1;
    }
    return minutes;
}
