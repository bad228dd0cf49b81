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

#include <nlohmann/json_fwd.hpp>

#include "IBrowserSession.h"

class Configuration;

/**
 * @brief IBrowserSession over the W3C WebDriver HTTP protocol (chromedriver).
 *
 * One WebDriver session, one window. Protocol errors that mean the session is
 * gone ("invalid session id", "no such window", "session not created", or an
 * "unknown error" reporting a dead or disconnected browser) and an unreachable
 * driver raise SessionFatal; everything else is transient.
 */
class WebDriverSession : public IBrowserSession {
public:
    struct Options {
        std::string driverUrl = "http://127.0.0.1:9515";
        bool headless = false;
        std::chrono::seconds pageLoadTimeout{ 60 };
        std::chrono::seconds scriptTimeout{ 30 };
        std::chrono::milliseconds pollInterval{ 250 };

        static Options LoadFrom(const Configuration& config);
    };

    explicit WebDriverSession(const Options& options);
    ~WebDriverSession() override;

    WebDriverSession(const WebDriverSession&) = delete;
    WebDriverSession& operator=(const WebDriverSession&) = delete;

    void open() override;
    void navigate(const std::string& url) override;
    void reload() override;
    bool waitForSelector(const std::string& cssSelector, std::chrono::milliseconds timeout) override;
    std::string mountedMarkup(const std::string& containerSelector) override;
    bool scrollLastIntoView(const std::string& rowSelector) override;
    std::string exportAuthState() override;
    void importAuthState(const std::string& state) override;
    void close() override;
    bool isOpen() const override { return !sessionId_.empty(); }

    // True when a WebDriver error response means the browser or session is gone.
    static bool isFatalError(const std::string& error, const std::string& message);

private:
    // Sends one command; returns the response "value" member.
    nlohmann::json command_(const std::string& method, const std::string& path, const nlohmann::json& body);
    nlohmann::json executeScript_(const std::string& script, const nlohmann::json& args);
    std::string sessionPath_(const std::string& suffix) const;
    void requireOpen_() const;
    long httpTimeoutFor_(const std::string& path) const;

    Options options_;
    std::string sessionId_;
};
