#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "Browser/IBrowserSession.h"
#include "Utility/Errors.h"

namespace testsupport {

struct FakeTeam {
    std::optional<int> rank;
    std::string name;          // empty = row carries no identity
    std::optional<int> pmr;
    std::optional<double> fpts;
};

inline std::string xmlEscape(const std::string& s)
{
    std::string out;
    for (char c : s) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            default: out += c;
        }
    }
    return out;
}

// Serialized like the live contest table: one row element per team.
inline std::string standingsRowMarkup(const FakeTeam& team)
{
    std::string out = "<div class=\"ReactVirtualized__Table__row ContestStandings_row\" role=\"row\"";
    if (!team.name.empty()) {
        out += " aria-label=\"view standings for " + xmlEscape(team.name) + "\"";
    }
    out += ">";
    if (team.rank) {
        out += "<div class=\"ContestStandings_rank-cell\">" + std::to_string(*team.rank) + "</div>";
    }
    if (!team.name.empty()) {
        out += "<div class=\"UsernameWithEntryIndex_team-name\">" + xmlEscape(team.name) + "</div>";
    }
    if (team.pmr) {
        out += "<div class=\"column-timeRemaining\"><div role=\"cell\"><span>" + std::to_string(*team.pmr) +
            "</span></div></div>";
    }
    if (team.fpts) {
        char buf[64];
        std::snprintf(buf, sizeof(buf), "%.2f", *team.fpts);
        out += "<div class=\"ContestStandings_fantasy-points-cell\"><div class=\"AnimatedNumber_animated-number\"><span>" +
            std::string(buf) + "</span></div></div>";
    }
    out += "</div>";
    return out;
}

inline std::string standingsTableMarkup(const std::vector<FakeTeam>& rows)
{
    std::string out = "<div xmlns=\"http://www.w3.org/1999/xhtml\" "
        "class=\"ReactVirtualized__Table ContestStandings_contest-standings-table\" role=\"grid\">"
        "<div class=\"ReactVirtualized__Grid__innerScrollContainer\" role=\"rowgroup\">";
    for (const auto& row : rows) {
        out += standingsRowMarkup(row);
    }
    out += "</div></div>";
    return out;
}

/**
 * A virtualized leaderboard: only `window` consecutive rows are mounted, and
 * scrolling the last mounted row into view moves the window forward.
 * Failures can be scripted per operation.
 */
class FakeStandingsView : public IBrowserSession {
public:
    explicit FakeStandingsView(std::vector<FakeTeam> teams = {}, size_t window = 5)
        : teams_(std::move(teams)), window_(window)
    {
    }

    // Every read mounts fresh, never-seen teams.
    bool endless = false;

    int transientMarkupFailures = 0;
    bool fatalOnReload = false;
    bool fatalOnOpen = false;
    bool containerAppears = true;
    std::string exportedAuth = "{\"version\":1,\"cookies\":[]}";

    std::atomic<int> openCalls{ 0 };
    std::atomic<int> closeCalls{ 0 };
    std::atomic<int> reloadCalls{ 0 };
    std::atomic<int> markupCalls{ 0 };
    std::atomic<int> scrollCalls{ 0 };

    void open() override
    {
        openCalls++;
        if (fatalOnOpen) throw SessionFatal("driver unreachable");
        open_ = true;
    }

    void navigate(const std::string& url) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        navigations_.push_back(url);
        offset_ = 0;
    }

    void reload() override
    {
        reloadCalls++;
        if (fatalOnReload) throw SessionFatal("invalid session id");
        std::lock_guard<std::mutex> lock(mutex_);
        offset_ = 0;
    }

    bool waitForSelector(const std::string&, std::chrono::milliseconds) override
    {
        return containerAppears;
    }

    std::string mountedMarkup(const std::string&) override
    {
        markupCalls++;
        std::lock_guard<std::mutex> lock(mutex_);
        if (transientMarkupFailures > 0) {
            transientMarkupFailures--;
            throw TransientPollError("navigation timed out");
        }
        return standingsTableMarkup(mounted_());
    }

    bool scrollLastIntoView(const std::string&) override
    {
        scrollCalls++;
        std::lock_guard<std::mutex> lock(mutex_);
        if (mounted_().empty()) return false;
        if (endless) {
            offset_ += window_;
            return true;
        }
        size_t maxOffset = teams_.size() > window_ ? teams_.size() - window_ : 0;
        offset_ = std::min(offset_ + (window_ > 1 ? window_ - 1 : 1), maxOffset);
        return true;
    }

    std::string exportAuthState() override { return exportedAuth; }

    void importAuthState(const std::string& state) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        importedAuth_ = state;
    }

    void close() override
    {
        closeCalls++;
        open_ = false;
    }

    bool isOpen() const override { return open_; }

    std::vector<std::string> navigations() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return navigations_;
    }

    std::string importedAuth() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return importedAuth_;
    }

private:
    std::vector<FakeTeam> mounted_() const
    {
        if (endless) {
            std::vector<FakeTeam> out;
            for (size_t i = 0; i < window_; ++i) {
                int n = static_cast<int>(offset_ + i);
                out.push_back({ n + 1, "team" + std::to_string(n), 10, 1.0 * n });
            }
            return out;
        }
        size_t begin = std::min(offset_, teams_.size());
        size_t end = std::min(offset_ + window_, teams_.size());
        return std::vector<FakeTeam>(teams_.begin() + begin, teams_.begin() + end);
    }

    std::vector<FakeTeam> teams_;
    size_t window_;
    size_t offset_ = 0;
    std::atomic<bool> open_{ false };
    mutable std::mutex mutex_;
    std::vector<std::string> navigations_;
    std::string importedAuth_;
};

inline std::vector<FakeTeam> makeTeams(int count)
{
    std::vector<FakeTeam> teams;
    for (int i = 0; i < count; ++i) {
        teams.push_back({ i + 1, "player" + std::to_string(i + 1) + " (" + std::to_string(i % 3 + 1) + "/3)",
            (i * 37) % 400, 150.0 - i * 2.5 });
    }
    return teams;
}

}
