#include <gtest/gtest.h>

#include "leaguesched/core/schedule/WeekPlanBuilder.h"
#include "leaguesched/core/season/SeasonConfiguration.h"
#include "leaguesched/core/tournament/PairingGenerator.h"

#include <algorithm>
#include <set>

namespace leaguesched::core::schedule {
namespace {

std::vector<league::Team> Teams(int count) {
    std::vector<league::Team> teams;
    for (int id = 1; id <= count; ++id) {
        teams.push_back({id, "Team " + std::to_string(id), 3});
    }
    return teams;
}

std::vector<league::WeekPairings> Pairings(int team_count, int weeks) {
    std::vector<int> ids;
    for (int id = 1; id <= team_count; ++id) {
        ids.push_back(id);
    }
    tournament::PairingGenerator generator([](const std::string&) {});
    tournament::SeasonPairings season;
    league::ScheduleError error;
    EXPECT_TRUE(generator.Generate(ids, weeks, season, &error)) << error.message;
    return season.weeks;
}

league::WeekDescriptor Week(league::WeekType type, int order) {
    league::WeekDescriptor week;
    week.date = util::CalendarDate{2025, 4, 6}.AddDays(7 * (order - 1));
    week.week_type = type;
    week.week_type_tag = league::ToString(type);
    week.week_order = order;
    return week;
}

WeekPlanSettings Settings(league::DivisionType type) {
    WeekPlanSettings settings;
    settings.division_type = type;
    settings.division_id = 3;
    return settings;
}

class WeekPlanBuilderTest : public ::testing::Test {
protected:
    util::LogFn Capture() {
        return [this](const std::string& line) { log_.push_back(line); };
    }

    bool Logged(const std::string& fragment) const {
        return std::any_of(log_.begin(), log_.end(), [&](const std::string& line) {
            return line.find(fragment) != std::string::npos;
        });
    }

    std::vector<std::string> log_;
};

// -----------------------------------------------------------------------------
// Playoff week: one placeholder row per real team
// -----------------------------------------------------------------------------
TEST_F(WeekPlanBuilderTest, PlayoffWeekEmitsOneRowPerTeam) {
    roster::RosterResolver roster(Teams(8));
    WeekPlanBuilder builder(roster, Settings(league::DivisionType::kPremier), Capture());
    auto week = Week(league::WeekType::kPlayoff, 10);
    week.playoff_round = 2;

    WeekPlanResult result;
    league::ScheduleError error;
    ASSERT_TRUE(builder.Build({week}, {}, result, &error)) << error.message;

    ASSERT_EQ(result.rows.size(), 8u);
    std::set<int> teams;
    for (const auto& row : result.rows) {
        EXPECT_EQ(row.home_team_id, row.away_team_id);
        EXPECT_TRUE(row.is_special_week);
        EXPECT_TRUE(row.is_playoff);
        EXPECT_EQ(row.playoff_round, 2);
        EXPECT_EQ(row.week_type, league::WeekType::kPlayoff);
        EXPECT_EQ(row.week_number, 10);
        EXPECT_EQ(row.division_id, 3);
        teams.insert(row.home_team_id);
    }
    EXPECT_EQ(teams, (std::set<int>{1, 2, 3, 4, 5, 6, 7, 8}));
}

TEST_F(WeekPlanBuilderTest, PlayoffRoundDefaultsToOne) {
    roster::RosterResolver roster(Teams(4));
    WeekPlanBuilder builder(roster, Settings(league::DivisionType::kClassic), Capture());

    WeekPlanResult result;
    league::ScheduleError error;
    ASSERT_TRUE(builder.Build({Week(league::WeekType::kPlayoff, 9)}, {}, result, &error));
    ASSERT_EQ(result.rows.size(), 4u);
    EXPECT_EQ(result.rows.front().playoff_round, 1);
}

// -----------------------------------------------------------------------------
// Practice weeks
// -----------------------------------------------------------------------------
TEST_F(WeekPlanBuilderTest, ClassicPracticeWeekLayout) {
    roster::RosterResolver roster(Teams(4));
    WeekPlanBuilder builder(roster, Settings(league::DivisionType::kClassic), Capture());

    WeekPlanResult result;
    league::ScheduleError error;
    ASSERT_TRUE(builder.Build({Week(league::WeekType::kPractice, 1)}, Pairings(4, 3), result, &error));
    ASSERT_EQ(result.rows.size(), 4u);
    EXPECT_EQ(result.pairings_used, 1);

    const auto& north_practice = result.rows[0];
    const auto& south_practice = result.rows[1];
    EXPECT_TRUE(north_practice.is_practice);
    EXPECT_TRUE(south_practice.is_practice);
    EXPECT_EQ(north_practice.field_name, "North");
    EXPECT_EQ(south_practice.field_name, "South");
    EXPECT_EQ(north_practice.scheduled_time.ToString(), "13:10");
    EXPECT_EQ(south_practice.scheduled_time.ToString(), "13:10");
    EXPECT_EQ(north_practice.home_team_id, north_practice.away_team_id);
    EXPECT_EQ(north_practice.home_team_id, 1);
    EXPECT_EQ(south_practice.home_team_id, 3);
    EXPECT_EQ(north_practice.week_type, league::WeekType::kPractice);

    for (size_t i = 2; i < 4; ++i) {
        const auto& match = result.rows[i];
        EXPECT_FALSE(match.is_practice);
        EXPECT_FALSE(match.is_special_week);
        EXPECT_EQ(match.week_type, league::WeekType::kRegular);
        EXPECT_EQ(match.scheduled_time.ToString(), "14:20");
        EXPECT_NE(match.home_team_id, match.away_team_id);
    }
    EXPECT_EQ(result.rows[2].home_team_id, 1);
    EXPECT_EQ(result.rows[2].away_team_id, 2);
    EXPECT_EQ(result.rows[3].home_team_id, 3);
    EXPECT_EQ(result.rows[3].away_team_id, 4);
}

TEST_F(WeekPlanBuilderTest, PracticeFlaggedRegularWeekUsesPracticeLayout) {
    roster::RosterResolver roster(Teams(4));
    WeekPlanBuilder builder(roster, Settings(league::DivisionType::kClassic), Capture());
    auto week = Week(league::WeekType::kRegular, 1);
    week.is_practice_session = true;

    WeekPlanResult result;
    league::ScheduleError error;
    ASSERT_TRUE(builder.Build({week}, Pairings(4, 3), result, &error));
    ASSERT_EQ(result.rows.size(), 4u);
    EXPECT_TRUE(result.rows[0].is_practice);
    EXPECT_EQ(result.rows[0].week_type, league::WeekType::kRegular);
    EXPECT_TRUE(result.regular_weeks.empty());
}

TEST_F(WeekPlanBuilderTest, PracticeFlagIgnoredOutsideClassic) {
    roster::RosterResolver roster(Teams(8));
    WeekPlanBuilder builder(roster, Settings(league::DivisionType::kPremier), Capture());
    auto week = Week(league::WeekType::kRegular, 1);
    week.is_practice_session = true;

    WeekPlanResult result;
    league::ScheduleError error;
    ASSERT_TRUE(builder.Build({week}, Pairings(8, 7), result, &error));
    EXPECT_EQ(result.rows.size(), 8u);
    EXPECT_TRUE(Logged("ignored outside Classic"));
}

// -----------------------------------------------------------------------------
// MIXED, unknown and missing data
// -----------------------------------------------------------------------------
TEST_F(WeekPlanBuilderTest, MixedWeekDependsOnDivision) {
    const auto mixed = Week(league::WeekType::kMixed, 5);
    league::ScheduleError error;

    roster::RosterResolver premier_roster(Teams(8));
    WeekPlanBuilder premier(premier_roster, Settings(league::DivisionType::kPremier), Capture());
    WeekPlanResult premier_result;
    ASSERT_TRUE(premier.Build({mixed}, Pairings(8, 7), premier_result, &error));
    ASSERT_EQ(premier_result.rows.size(), 8u);
    EXPECT_EQ(premier_result.rows.front().week_type, league::WeekType::kPlayoff);
    EXPECT_EQ(premier_result.pairings_used, 0);

    roster::RosterResolver classic_roster(Teams(4));
    WeekPlanBuilder classic(classic_roster, Settings(league::DivisionType::kClassic), Capture());
    WeekPlanResult classic_result;
    ASSERT_TRUE(classic.Build({mixed}, Pairings(4, 3), classic_result, &error));
    ASSERT_EQ(classic_result.rows.size(), 4u);
    EXPECT_EQ(classic_result.rows.front().week_type, league::WeekType::kRegular);
    EXPECT_EQ(classic_result.pairings_used, 1);

    WeekPlanBuilder other(classic_roster, Settings(league::DivisionType::kEcsFc), Capture());
    WeekPlanResult other_result;
    ASSERT_TRUE(other.Build({mixed}, Pairings(4, 3), other_result, &error));
    EXPECT_TRUE(other_result.rows.empty());
    EXPECT_EQ(other_result.skipped_weeks, 1);
}

TEST_F(WeekPlanBuilderTest, UnknownWeekTypeIsLoggedAndSkipped) {
    roster::RosterResolver roster(Teams(4));
    WeekPlanBuilder builder(roster, Settings(league::DivisionType::kClassic), Capture());
    auto week = Week(league::WeekType::kUnknown, 2);
    week.week_type_tag = "SCRIMMAGE";

    WeekPlanResult result;
    league::ScheduleError error;
    ASSERT_TRUE(builder.Build({Week(league::WeekType::kRegular, 1), week}, Pairings(4, 3), result, &error));
    EXPECT_EQ(result.rows.size(), 4u);
    EXPECT_EQ(result.skipped_weeks, 1);
    EXPECT_TRUE(Logged("Unknown week type 'SCRIMMAGE'"));
}

TEST_F(WeekPlanBuilderTest, MissingDateFailsWithoutRows) {
    roster::RosterResolver roster(Teams(4));
    WeekPlanBuilder builder(roster, Settings(league::DivisionType::kClassic), Capture());
    auto undated = Week(league::WeekType::kRegular, 2);
    undated.date.reset();

    WeekPlanResult result;
    league::ScheduleError error;
    EXPECT_FALSE(builder.Build({Week(league::WeekType::kRegular, 1), undated}, Pairings(4, 3), result, &error));
    EXPECT_EQ(error.code, league::ScheduleErrorCode::kMissingWeekDate);
    EXPECT_TRUE(result.rows.empty());
}

TEST_F(WeekPlanBuilderTest, RunningOutOfPairingsSkipsWeek) {
    roster::RosterResolver roster(Teams(4));
    WeekPlanBuilder builder(roster, Settings(league::DivisionType::kClassic), Capture());

    WeekPlanResult result;
    league::ScheduleError error;
    ASSERT_TRUE(builder.Build({Week(league::WeekType::kRegular, 1), Week(league::WeekType::kRegular, 2)},
                              Pairings(4, 1), result, &error));
    EXPECT_EQ(result.rows.size(), 4u);
    EXPECT_EQ(result.skipped_weeks, 1);
    EXPECT_TRUE(Logged("No pairings left"));
}

TEST_F(WeekPlanBuilderTest, OtherDivisionsUseConfiguredStartTime) {
    roster::RosterResolver roster(Teams(4));
    auto settings = Settings(league::DivisionType::kEcsFc);
    settings.start_time = {18, 0};
    settings.match_minutes = 60;
    WeekPlanBuilder builder(roster, settings, Capture());

    WeekPlanResult result;
    league::ScheduleError error;
    ASSERT_TRUE(builder.Build({Week(league::WeekType::kRegular, 1)}, Pairings(4, 3), result, &error));
    ASSERT_EQ(result.rows.size(), 4u);
    EXPECT_EQ(result.rows[0].scheduled_time.ToString(), "18:00");
    EXPECT_EQ(result.rows[3].scheduled_time.ToString(), "19:00");
}

// -----------------------------------------------------------------------------
// Virtual placeholders never leak into real fixtures
// -----------------------------------------------------------------------------
TEST_F(WeekPlanBuilderTest, FullPremierSeasonKeepsPlaceholdersIsolated) {
    roster::RosterResolver roster(Teams(8));
    ASSERT_EQ(roster.placeholder_teams().size(), 3u);
    const auto config = season::SeasonConfiguration::DefaultsFor(league::DivisionType::kPremier);
    const auto weeks = season::BuildWeekDescriptors(config, {2025, 3, 2});
    WeekPlanBuilder builder(roster, Settings(league::DivisionType::kPremier), Capture());

    WeekPlanResult result;
    league::ScheduleError error;
    ASSERT_TRUE(builder.Build(weeks, Pairings(8, 7), result, &error)) << error.message;

    // 7 regular weeks of 8 matches, FUN, TST, BONUS and two playoff weeks of 8 rows.
    EXPECT_EQ(result.rows.size(), 96u);
    EXPECT_EQ(result.regular_weeks.size(), 7u);
    EXPECT_EQ(result.pairings_used, 7);

    const auto fun = roster.PlaceholderFor(league::WeekType::kFun);
    const auto tst = roster.PlaceholderFor(league::WeekType::kTst);
    for (const auto& row : result.rows) {
        EXPECT_GT(row.home_team_id, 0);
        EXPECT_GT(row.away_team_id, 0);
        if (row.week_type == league::WeekType::kRegular) {
            EXPECT_FALSE(row.is_special_week);
            EXPECT_EQ(row.placeholder_team_id, 0);
            EXPECT_NE(row.home_team_id, row.away_team_id);
        } else if (row.week_type == league::WeekType::kFun) {
            EXPECT_EQ(row.placeholder_team_id, fun->id);
        } else if (row.week_type == league::WeekType::kTst) {
            EXPECT_EQ(row.placeholder_team_id, tst->id);
        } else {
            EXPECT_EQ(row.placeholder_team_id, 0);
            EXPECT_TRUE(row.is_special_week);
        }
    }
    EXPECT_LE(fun->id, roster::kFirstPlaceholderId);
}

}  // namespace
}  // namespace leaguesched::core::schedule
