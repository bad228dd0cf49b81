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

// Logging
#define OPTION_LOG "log"
#define OPTION_LOGFILE "log.file"

// Target and authentication
#define OPTION_TARGETFILE "target.file"
#define OPTION_AUTHFILE "auth.file"

// Browser automation
#define OPTION_WEBDRIVERURL "webdriver.url"
#define OPTION_WEBDRIVERHEADLESS "webdriver.headless"
#define OPTION_HOMEURL "browser.home_url"
#define OPTION_PAGESETTLESECONDS "browser.page_settle_seconds"
#define OPTION_READYTIMEOUTSECONDS "browser.ready_timeout_seconds"

// Collector
#define OPTION_COLLECTORSETTLEMS "collector.settle_ms"
#define OPTION_COLLECTORMAXITERATIONS "collector.max_iterations"

// Scheduler
#define OPTION_POLLINTERVALSECONDS "scheduler.poll_interval_seconds"
#define OPTION_REFRESHSETTLESECONDS "scheduler.refresh_settle_seconds"
#define OPTION_BACKOFFSECONDS "scheduler.backoff_seconds"
#define OPTION_TICKMS "scheduler.tick_ms"

// Persistence
#define OPTION_SNAPSHOTSDIR "snapshots.dir"

// Projection
#define OPTION_PROJECTIONSIGMA2 "projection.sigma2"
#define OPTION_PROJECTIONRATE "projection.rate_per_minute"
#define OPTION_PROJECTIONSIMS "projection.sims"
#define OPTION_PROJECTIONSEED "projection.seed"
#define OPTION_PROJECTIONTHREADS "projection.threads"

// Extraction profile overrides ("sel | sel@attr | ...")
#define OPTION_EXTRACTPREFIX "extract"
