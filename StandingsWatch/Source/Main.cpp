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
#include "Browser/WebDriverSession.h"
#include "Database/Configuration.h"
#include "Database/GlobalOpts.h"
#include "Extract/ExtractionProfile.h"
#include "Extract/SnapshotExtractor.h"
#include "Persist/CsvSnapshotSink.h"
#include "Persist/SnapshotHistory.h"
#include "Projection/ProjectionEngine.h"
#include "Projection/ProjectionReport.h"
#include "Scheduler/PollScheduler.h"
#include "Utility/Errors.h"
#include "Utility/HttpClient.h"
#include "Utility/Log.h"
#include "Utility/Utils.h"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

static volatile std::sig_atomic_t gSignalled = 0;

static void handleSignal(int)
{
    gSignalled = 1;
}

static void printUsage()
{
    std::cout << "Usage: standingswatch [-c settings.conf] <command>\n"
        << "  run                  poll the contest until interrupted\n"
        << "  once                 collect and save a single snapshot\n"
        << "  report [--json] [dir]  project the newest saved snapshot\n";
}

static bool importConfiguration(Configuration& config, const std::string& settingsFile)
{
    if (settingsFile.empty()) {
        // settings.conf beside the base path is optional
        config.import("", Utils::combinePath(Configuration::absolutePath, "settings.conf"), false);
        return true;
    }
    if (Utils::getEnvVar("STANDINGSWATCH_ROOT").empty()) {
        std::string directory = Utils::getDirectory(settingsFile);
        if (!directory.empty()) {
            Configuration::absolutePath = Configuration::convertToAbsolutePath(Configuration::absolutePath, directory);
        }
    }
    return config.import("", settingsFile);
}

static std::string snapshotsDirectory(const Configuration& config)
{
    std::string dir = Configuration::convertToAbsolutePath(Configuration::absolutePath, "data_downloads");
    config.getPropertyAbsolutePath(OPTION_SNAPSHOTSDIR, dir);
    return dir;
}

static int runReport(const Configuration& config, const std::string& directory, bool asJson)
{
    SnapshotHistory history;
    history.loadDirectory(directory.empty() ? snapshotsDirectory(config) : directory);

    ProjectionEngine engine(ProjectionParams::LoadFrom(config));
    std::optional<ProjectionReport> report = ProjectionReport::latest(history, engine);
    if (!report) {
        LOG_ERROR("StandingsWatch", "No snapshots to report on");
        return 1;
    }
    std::cout << (asJson ? report->toJson() : report->toText()) << std::endl;
    return 0;
}

static int runCollector(const Configuration& config, bool once)
{
    ExtractionProfile profile = ExtractionProfile::contestStandings();
    int overrides = profile.applyOverrides(config);
    if (overrides > 0) {
        LOG_INFO("StandingsWatch", "Extraction profile: " << overrides << " fields overridden from configuration");
    }

    std::unique_ptr<SnapshotExtractor> extractor;
    try {
        extractor = std::make_unique<SnapshotExtractor>(profile);
    }
    catch (const ConfigError& e) {
        LOG_ERROR("StandingsWatch", e.what());
        return 1;
    }

    if (!HttpClient::globalInit()) {
        return 1;
    }

    int rc = 0;
    {
        CsvSnapshotSink sink(snapshotsDirectory(config));
        std::unique_ptr<IBrowserSession> session =
            std::make_unique<WebDriverSession>(WebDriverSession::Options::LoadFrom(config));
        PollScheduler scheduler(std::move(session), *extractor, sink, SchedulerConfig::LoadFrom(config));

        if (once) {
            std::atomic<bool> done{ false };
            bool ok = false;
            std::thread worker([&]() {
                ok = scheduler.runOnce();
                done = true;
            });
            while (!done && !gSignalled) {
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
            if (!done) {
                scheduler.stop();
            }
            worker.join();
            rc = ok ? 0 : 1;
        }
        else {
            scheduler.start();
            while (!gSignalled && scheduler.status().state != SchedulerState::CLOSED) {
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
            scheduler.stop();
            scheduler.close();

            SchedulerStatus status = scheduler.status();
            LOG_INFO("StandingsWatch", "Stopped after " << status.totalPolls << " snapshots");
            rc = (!gSignalled && !status.lastError.empty()) ? 1 : 0;
        }
    }

    HttpClient::globalCleanup();
    return rc;
}

int main(int argc, char** argv)
{
    std::string settingsFile;
    std::string command;
    std::string reportDirectory;
    bool asJson = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-c" && i + 1 < argc) {
            settingsFile = argv[++i];
        }
        else if (arg == "--json") {
            asJson = true;
        }
        else if (arg == "-h" || arg == "--help") {
            printUsage();
            return 0;
        }
        else if (command.empty()) {
            command = arg;
        }
        else if (command == "report" && reportDirectory.empty()) {
            reportDirectory = arg;
        }
        else {
            printUsage();
            return 2;
        }
    }
    if (command != "run" && command != "once" && command != "report") {
        printUsage();
        return 2;
    }

    Configuration::initialize();
    Configuration config;
    bool imported = importConfiguration(config, settingsFile);

    std::string logFile = Configuration::convertToAbsolutePath(Configuration::absolutePath, "standingswatch.log");
    config.getProperty(OPTION_LOGFILE, logFile);
    if (!logFile.empty()) {
        logFile = Configuration::convertToAbsolutePath(Configuration::absolutePath, logFile);
    }
    if (!Logger::initialize(logFile, &config)) {
        std::cerr << "Could not open log file " << logFile << std::endl;
        return 1;
    }
    if (!imported) {
        LOG_ERROR("StandingsWatch", "Could not load " << settingsFile);
        Logger::deInitialize();
        return 1;
    }
    LOG_INFO("StandingsWatch", "Base path is " << Configuration::absolutePath);

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    int rc = command == "report"
        ? runReport(config, reportDirectory, asJson)
        : runCollector(config, command == "once");

    Logger::deInitialize();
    return rc;
}
