#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "Persist/SnapshotHistory.h"
#include "Projection/ProjectionReport.h"
#include "Standings/StandingsSnapshot.h"

namespace {

Projection sampleProjection()
{
    Projection p;
    p.timeIndex = 28333333;
    p.sims = 1000;
    p.results = {
        { "steady", 80, 60, 95, 5.48, 0.05 },
        { "late surge", 36, 360, 126, 13.42, 0.93 },
        { "middle", 75, 90, 97.5, 6.71, 0.02 },
    };
    p.excluded = { "ghost" };
    return p;
}

}

TEST(ProjectionReportTest, RowsOrderedByProjectedFinal)
{
    ProjectionReport report(sampleProjection());
    ASSERT_EQ(3u, report.rows().size());
    EXPECT_EQ("late surge", report.rows()[0].teamName);
    EXPECT_EQ("middle", report.rows()[1].teamName);
    EXPECT_EQ("steady", report.rows()[2].teamName);
}

TEST(ProjectionReportTest, TextTableShowsOneDecimalAndPercent)
{
    std::string text = ProjectionReport(sampleProjection()).toText();
    EXPECT_NE(std::string::npos, text.find("Current FPTS"));
    EXPECT_NE(std::string::npos, text.find("Projected Final"));
    EXPECT_NE(std::string::npos, text.find("Win Probability"));
    EXPECT_NE(std::string::npos, text.find("126.0"));
    EXPECT_NE(std::string::npos, text.find("93.0%"));
    EXPECT_NE(std::string::npos, text.find("1 entries"));
    EXPECT_EQ(std::string::npos, text.find("DEGRADED"));
}

TEST(ProjectionReportTest, LongTeamNamesKeepTheirWholeRow)
{
    Projection p = sampleProjection();
    std::string longName(600, 'x');
    p.results.push_back({ longName, 10, 0, 10, 0, 0 });

    std::string text = ProjectionReport(p).toText();
    size_t at = text.find(longName);
    ASSERT_NE(std::string::npos, at);
    size_t end = text.find('\n', at);
    ASSERT_NE(std::string::npos, end);
    std::string row = text.substr(at, end - at);
    EXPECT_NE(std::string::npos, row.find("10.0"));
    EXPECT_EQ('%', row.back());
    EXPECT_NE(std::string::npos, text.find("1 entries"));
}

TEST(ProjectionReportTest, JsonCarriesRowsAndDegradedFlag)
{
    Projection degraded = sampleProjection();
    degraded.degraded = true;
    degraded.degradedReason = "negative pmr for x";

    nlohmann::json j = nlohmann::json::parse(ProjectionReport(degraded).toJson());
    EXPECT_TRUE(j["degraded"].get<bool>());
    EXPECT_EQ("negative pmr for x", j["degradedReason"].get<std::string>());
    EXPECT_EQ(28333333, j["timeIndex"].get<long long>());
    ASSERT_EQ(3u, j["rows"].size());
    EXPECT_EQ("late surge", j["rows"][0]["team"].get<std::string>());
    EXPECT_EQ(1, j["rows"][0]["position"].get<int>());
    EXPECT_DOUBLE_EQ(0.93, j["rows"][0]["winProbability"].get<double>());
    EXPECT_EQ("ghost", j["excluded"][0].get<std::string>());

    EXPECT_NE(std::string::npos, ProjectionReport(degraded).toText().find("DEGRADED"));
}

TEST(ProjectionReportTest, LatestUsesNewestSnapshot)
{
    ProjectionParams params;
    params.sims = 200;
    params.seed = 1;
    params.threads = 1;
    ProjectionEngine engine(params);

    SnapshotHistory history;
    EXPECT_FALSE(ProjectionReport::latest(history, engine).has_value());

    StandingsRow row;
    row.teamName = "only";
    row.fpts = 10;
    row.pmr = 0;
    history.add(StandingsSnapshot(5, { row }));
    history.add(StandingsSnapshot(9, { row }));

    std::optional<ProjectionReport> report = ProjectionReport::latest(history, engine);
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(9, report->timeIndex());
    EXPECT_EQ(1.0, report->rows()[0].winProbability);
}
