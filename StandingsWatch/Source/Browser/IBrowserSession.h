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
#include <string>

/**
 * @brief One automated browser page, driven by a single owner.
 *
 * Not reentrant: callers must not overlap operations on one session.
 * Implementations throw TransientPollError for recoverable failures and
 * SessionFatal when the session itself is gone.
 */
class IBrowserSession {
public:
    virtual ~IBrowserSession() = default;

    // Starts the browser and its single page.
    virtual void open() = 0;

    virtual void navigate(const std::string& url) = 0;

    // Full reload of the current page.
    virtual void reload() = 0;

    // True once an element matching cssSelector exists, false on timeout.
    virtual bool waitForSelector(const std::string& cssSelector, std::chrono::milliseconds timeout) = 0;

    // XHTML serialization of the first element matching containerSelector,
    // empty when there is none.
    virtual std::string mountedMarkup(const std::string& containerSelector) = 0;

    // Scrolls the last element matching rowSelector into view. False if none.
    virtual bool scrollLastIntoView(const std::string& rowSelector) = 0;

    // Opaque authentication material (cookies) for reuse by a later run.
    virtual std::string exportAuthState() = 0;
    virtual void importAuthState(const std::string& state) = 0;

    // Releases the browser. Idempotent.
    virtual void close() = 0;

    virtual bool isOpen() const = 0;
};
