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

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "../Browser/AuthStore.h"
#include "../Collect/IncrementalCollector.h"

class Configuration;
class IBrowserSession;
class ISnapshotSink;
class SnapshotExtractor;

enum class SchedulerState {
    UNINITIALIZED,
    AUTHENTICATING,
    READY,
    POLLING,
    REFRESHING,
    ERROR,
    RETRY_BACKOFF,
    CLOSED
};

// Copy of the scheduler's session state for readers on other threads.
struct SchedulerStatus {
    SchedulerState state = SchedulerState::UNINITIALIZED;
    std::optional<std::chrono::system_clock::time_point> lastSuccessfulPoll;
    int consecutiveFailures = 0;
    std::string lastError;
    std::string lastSnapshotPath;
    long long lastTimeIndex = 0;
    long long totalPolls = 0;
};

struct SchedulerConfig {
    std::string targetFile = "contests.txt";
    std::string authFile = "auth_state.json";
    std::string homeUrl = "https://www.draftkings.com";

    std::chrono::milliseconds pollInterval{ 45000 };
    std::chrono::milliseconds refreshSettle{ 15000 };
    std::chrono::milliseconds backoff{ 60000 };
    std::chrono::milliseconds tick{ 1000 };
    std::chrono::milliseconds pageSettle{ 10000 };
    std::chrono::milliseconds readyTimeout{ 30000 };

    IncrementalCollector::Options collector;

    // File keys resolve against Configuration::absolutePath.
    static SchedulerConfig LoadFrom(const Configuration& config);
};

/**
 * @brief Owns the one browser session and drives the periodic poll loop.
 *
 * UNINITIALIZED -> AUTHENTICATING -> READY -> POLLING <-> REFRESHING -> CLOSED.
 * Any failure passes through ERROR; recoverable ones continue with
 * RETRY_BACKOFF and return to POLLING, fatal ones end in CLOSED.
 * All waits are sliced into ticks and end early when stop() is called.
 */
class PollScheduler {
public:
    // Blocks until the user has logged in on the page the session shows.
    typedef std::function<void(IBrowserSession& session, const std::string& loginUrl)> LoginPrompt;

    PollScheduler(std::unique_ptr<IBrowserSession> session,
        const SnapshotExtractor& extractor,
        ISnapshotSink& sink,
        const SchedulerConfig& config);
    ~PollScheduler();

    PollScheduler(const PollScheduler&) = delete;
    PollScheduler& operator=(const PollScheduler&) = delete;

    void setLoginPrompt(LoginPrompt prompt) { loginPrompt_ = std::move(prompt); }

    // Runs the loop on a worker thread.
    void start();
    // Requests cancellation and joins the worker, if any.
    void stop();
    // Runs the loop on the calling thread until stopped or closed.
    void run();
    // Initializes, collects and persists one snapshot, then closes.
    bool runOnce();

    SchedulerStatus status() const;
    bool stopRequested() const { return stopRequested_.load(); }

    // Releases the browser session. Safe to call any number of times.
    void close();

    static std::string stateToString(SchedulerState state);

    // First line, BOM stripped and trimmed. Throws ConfigError when it is blank.
    static std::string readTarget(const std::string& path);

    static LoginPrompt consoleLoginPrompt();

private:
    bool initialize_();
    void authenticate_();
    void pollOnce_();
    bool cycle_();
    bool backoff_(const std::string& error);
    void recordError_(const std::string& error);
    bool sleepFor_(std::chrono::milliseconds duration);
    void setState_(SchedulerState newState);
    long long nextTimeIndex_(std::chrono::system_clock::time_point now);

    std::unique_ptr<IBrowserSession> session_;
    const SnapshotExtractor& extractor_;
    ISnapshotSink& sink_;
    SchedulerConfig config_;
    AuthStore authStore_;
    IncrementalCollector collector_;
    LoginPrompt loginPrompt_;
    std::string targetUrl_;

    mutable std::mutex statusMutex_;
    SchedulerStatus status_;

    std::mutex stopMutex_;
    std::condition_variable stopCondition_;
    std::atomic<bool> stopRequested_{ false };

    std::mutex closeMutex_;
    bool closed_ = false;

    std::thread worker_;
};
