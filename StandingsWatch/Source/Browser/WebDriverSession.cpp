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

#include "WebDriverSession.h"
#include "../Database/Configuration.h"
#include "../Database/GlobalOpts.h"
#include "../Utility/Errors.h"
#include "../Utility/HttpClient.h"
#include "../Utility/Log.h"
#include <algorithm>
#include <cctype>
#include <thread>

#include <nlohmann/json.hpp>
using json = nlohmann::json;

namespace
{
    const char* const kMarkupScript =
        "var el = document.querySelector(arguments[0]);"
        "return el ? new XMLSerializer().serializeToString(el) : '';";

    const char* const kScrollScript =
        "var rows = document.querySelectorAll(arguments[0]);"
        "if (!rows.length) return false;"
        "rows[rows.length - 1].scrollIntoView({block: 'end'});"
        "return true;";

    const char* const kExistsScript =
        "return document.querySelector(arguments[0]) !== null;";
}

WebDriverSession::Options WebDriverSession::Options::LoadFrom(const Configuration& config)
{
    Options out;
    config.getProperty(OPTION_WEBDRIVERURL, out.driverUrl);
    config.getProperty(OPTION_WEBDRIVERHEADLESS, out.headless);
    while (!out.driverUrl.empty() && out.driverUrl.back() == '/') {
        out.driverUrl.pop_back();
    }
    return out;
}

WebDriverSession::WebDriverSession(const Options& options)
    : options_(options)
{
}

WebDriverSession::~WebDriverSession()
{
    close();
}

bool WebDriverSession::isFatalError(const std::string& error, const std::string& message)
{
    if (error == "invalid session id" || error == "no such window" || error == "session not created") {
        return true;
    }
    // chromedriver reports a crashed or closed browser as a generic unknown error
    if (error == "unknown error") {
        std::string lower = message;
        std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return lower.find("chrome not reachable") != std::string::npos
            || lower.find("disconnected") != std::string::npos
            || lower.find("browser has closed") != std::string::npos
            || lower.find("target window already closed") != std::string::npos;
    }
    return false;
}

std::string WebDriverSession::sessionPath_(const std::string& suffix) const
{
    return "/session/" + HttpClient::urlEncode(sessionId_) + suffix;
}

void WebDriverSession::requireOpen_() const
{
    if (sessionId_.empty()) {
        throw SessionFatal("browser session is not open");
    }
}

long WebDriverSession::httpTimeoutFor_(const std::string& path) const
{
    // Navigation blocks for up to the page load timeout on the driver side
    long pageLoad = static_cast<long>(options_.pageLoadTimeout.count());
    long script = static_cast<long>(options_.scriptTimeout.count());
    if (path.find("/url") != std::string::npos || path.find("/refresh") != std::string::npos) {
        return pageLoad + 30;
    }
    if (path == "/session") {
        return 120;
    }
    return script + 30;
}

json WebDriverSession::command_(const std::string& method, const std::string& path, const json& body)
{
    const std::string url = options_.driverUrl + path;
    const std::string payload = body.is_null() ? std::string() : body.dump();

    HttpResponse response;
    std::string err;
    HttpClient::Transport transport = HttpClient::request(method, url, payload,
        { "Content-Type: application/json; charset=utf-8" }, httpTimeoutFor_(path), response, err);

    if (transport == HttpClient::Transport::Unreachable) {
        throw SessionFatal("WebDriver unreachable at " + options_.driverUrl + ": " + err);
    }
    if (transport != HttpClient::Transport::Ok) {
        throw TransientPollError(method + " " + path + ": " + err);
    }

    json parsed;
    try {
        parsed = json::parse(response.body);
    }
    catch (const json::parse_error& e) {
        throw TransientPollError(method + " " + path + ": HTTP " + std::to_string(response.status) +
            ", unparsable body (" + e.what() + ")");
    }

    json value = parsed.contains("value") ? parsed["value"] : json();
    if (value.is_object() && value.contains("error") && value["error"].is_string()) {
        const std::string error = value["error"].get<std::string>();
        const std::string message = value.value("message", std::string());
        if (isFatalError(error, message)) {
            throw SessionFatal("WebDriver " + error + ": " + message);
        }
        throw TransientPollError("WebDriver " + error + ": " + message);
    }
    if (response.status < 200 || response.status >= 300) {
        throw TransientPollError(method + " " + path + ": HTTP " + std::to_string(response.status));
    }
    return value;
}

json WebDriverSession::executeScript_(const std::string& script, const json& args)
{
    requireOpen_();
    return command_("POST", sessionPath_("/execute/sync"), json{ {"script", script}, {"args", args} });
}

void WebDriverSession::open()
{
    if (isOpen()) {
        return;
    }

    json chromeArgs = json::array();
    if (options_.headless) {
        chromeArgs.push_back("--headless=new");
    }

    // "eager" returns at DOMContentLoaded
    json capabilities = {
        {"capabilities", {
            {"alwaysMatch", {
                {"browserName", "chrome"},
                {"pageLoadStrategy", "eager"},
                {"goog:chromeOptions", { {"args", chromeArgs} }}
            }}
        }}
    };

    json value = command_("POST", "/session", capabilities);
    if (!value.is_object() || !value.contains("sessionId") || !value["sessionId"].is_string()) {
        throw SessionFatal("WebDriver returned no session id");
    }
    sessionId_ = value["sessionId"].get<std::string>();
    LOG_INFO("WebDriver", "Session " << sessionId_ << " started via " << options_.driverUrl);

    json timeouts = {
        {"pageLoad", std::chrono::duration_cast<std::chrono::milliseconds>(options_.pageLoadTimeout).count()},
        {"script", std::chrono::duration_cast<std::chrono::milliseconds>(options_.scriptTimeout).count()}
    };
    command_("POST", sessionPath_("/timeouts"), timeouts);
}

void WebDriverSession::navigate(const std::string& url)
{
    requireOpen_();
    LOG_INFO("WebDriver", "Navigating to " << url);
    command_("POST", sessionPath_("/url"), json{ {"url", url} });
}

void WebDriverSession::reload()
{
    requireOpen_();
    command_("POST", sessionPath_("/refresh"), json::object());
}

bool WebDriverSession::waitForSelector(const std::string& cssSelector, std::chrono::milliseconds timeout)
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        json found = executeScript_(kExistsScript, json::array({ cssSelector }));
        if (found.is_boolean() && found.get<bool>()) {
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(options_.pollInterval);
    }
}

std::string WebDriverSession::mountedMarkup(const std::string& containerSelector)
{
    json markup = executeScript_(kMarkupScript, json::array({ containerSelector }));
    return markup.is_string() ? markup.get<std::string>() : std::string();
}

bool WebDriverSession::scrollLastIntoView(const std::string& rowSelector)
{
    json scrolled = executeScript_(kScrollScript, json::array({ rowSelector }));
    return scrolled.is_boolean() && scrolled.get<bool>();
}

std::string WebDriverSession::exportAuthState()
{
    requireOpen_();
    json cookies = command_("GET", sessionPath_("/cookie"), json());
    json state = {
        {"version", 1},
        {"cookies", cookies.is_array() ? cookies : json::array()}
    };
    return state.dump(2);
}

void WebDriverSession::importAuthState(const std::string& state)
{
    requireOpen_();

    json root;
    try {
        root = json::parse(state);
    }
    catch (const json::parse_error& e) {
        throw TransientPollError(std::string("auth state is not JSON: ") + e.what());
    }
    if (!root.contains("cookies") || !root["cookies"].is_array()) {
        throw TransientPollError("auth state has no 'cookies' array");
    }

    int added = 0;
    for (const auto& cookie : root["cookies"]) {
        if (!cookie.is_object() || !cookie.contains("name")) continue;
        try {
            command_("POST", sessionPath_("/cookie"), json{ {"cookie", cookie} });
            added++;
        }
        catch (const TransientPollError& e) {
            // Cookies for domains other than the current page are rejected
            LOG_DEBUG("WebDriver", "Skipped cookie " << cookie.value("name", std::string()) << ": " << e.what());
        }
    }
    LOG_INFO("WebDriver", "Restored " << added << " of " << root["cookies"].size() << " cookies");
}

void WebDriverSession::close()
{
    if (sessionId_.empty()) {
        return;
    }

    std::string id = sessionId_;
    try {
        command_("DELETE", sessionPath_(""), json());
        LOG_INFO("WebDriver", "Session " << id << " closed");
    }
    catch (const std::exception& e) {
        LOG_WARNING("WebDriver", "Closing session " << id << " failed: " << e.what());
    }
    sessionId_.clear();
}
