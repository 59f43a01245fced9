#include <gtest/gtest.h>

#include "leaguesched/core/season/SeasonConfiguration.h"

namespace leaguesched::core::season {
namespace {

std::vector<league::WeekType> TypesOf(const std::vector<league::WeekDescriptor>& weeks) {
    std::vector<league::WeekType> types;
    for (const auto& week : weeks) {
        types.push_back(week.week_type);
    }
    return types;
}

TEST(SeasonConfigurationTest, DivisionDefaults) {
    const auto premier = SeasonConfiguration::DefaultsFor(league::DivisionType::kPremier);
    EXPECT_EQ(premier.regular_season_weeks, 7);
    EXPECT_EQ(premier.playoff_weeks, 2);
    EXPECT_TRUE(premier.has_fun_week);
    EXPECT_TRUE(premier.has_tst_week);
    EXPECT_TRUE(premier.has_bonus_week);
    EXPECT_FALSE(premier.has_practice_sessions);

    const auto classic = SeasonConfiguration::DefaultsFor(league::DivisionType::kClassic);
    EXPECT_EQ(classic.regular_season_weeks, 8);
    EXPECT_EQ(classic.playoff_weeks, 1);
    EXPECT_FALSE(classic.has_fun_week);
    EXPECT_FALSE(classic.has_practice_sessions);
    EXPECT_EQ(classic.practice_weeks, (std::vector<int>{1, 2}));

    const auto ecs = SeasonConfiguration::DefaultsFor(league::DivisionType::kEcsFc);
    EXPECT_EQ(ecs.regular_season_weeks, 8);
    EXPECT_FALSE(ecs.has_bonus_week);
}

TEST(SeasonConfigurationTest, PremierLayout) {
    const auto config = SeasonConfiguration::DefaultsFor(league::DivisionType::kPremier);
    const auto weeks = BuildWeekDescriptors(config, {2025, 3, 2});

    using league::WeekType;
    const std::vector<WeekType> expected = {
        WeekType::kRegular, WeekType::kRegular, WeekType::kRegular, WeekType::kRegular,
        WeekType::kFun,     WeekType::kRegular, WeekType::kRegular, WeekType::kRegular,
        WeekType::kTst,     WeekType::kPlayoff, WeekType::kPlayoff, WeekType::kBonus,
    };
    EXPECT_EQ(TypesOf(weeks), expected);
    EXPECT_EQ(weeks.front().week_order, 1);
    EXPECT_EQ(weeks.back().week_order, 12);
    EXPECT_EQ(weeks[1].date->ToString(), "2025-03-09");
    EXPECT_EQ(weeks[9].playoff_round.value_or(0), 1);
    EXPECT_EQ(weeks[10].playoff_round.value_or(0), 2);
    EXPECT_EQ(weeks[4].week_type_tag, "FUN");
}

TEST(SeasonConfigurationTest, ClassicPracticeWeeksOnlyWhenEnabled) {
    auto config = SeasonConfiguration::DefaultsFor(league::DivisionType::kClassic);
    auto weeks = BuildWeekDescriptors(config, {2025, 3, 2});
    ASSERT_EQ(weeks.size(), 9u);
    for (const auto& week : weeks) {
        EXPECT_FALSE(week.is_practice_session);
    }

    config.has_practice_sessions = true;
    config.practice_weeks = {1, 6};
    weeks = BuildWeekDescriptors(config, {2025, 3, 2}, 14);
    EXPECT_TRUE(weeks[0].is_practice_session);
    EXPECT_FALSE(weeks[1].is_practice_session);
    // Regular week 6 is the sixth descriptor: no FUN week in between.
    EXPECT_TRUE(weeks[5].is_practice_session);
    EXPECT_EQ(weeks[1].date->ToString(), "2025-03-16");
    EXPECT_EQ(weeks.back().week_type, league::WeekType::kPlayoff);
}

TEST(SeasonConfigurationTest, PracticeFlagsIgnoredOutsideClassic) {
    auto config = SeasonConfiguration::DefaultsFor(league::DivisionType::kEcsFc);
    config.has_practice_sessions = true;
    config.practice_weeks = {1};
    const auto weeks = BuildWeekDescriptors(config, {2025, 3, 2});
    EXPECT_FALSE(weeks.front().is_practice_session);
}

TEST(LeagueTypesTest, ParsesTagsLeniently) {
    EXPECT_EQ(league::ParseWeekType("regular"), league::WeekType::kRegular);
    EXPECT_EQ(league::ParseWeekType("Playoff"), league::WeekType::kPlayoff);
    EXPECT_EQ(league::ParseWeekType("scrimmage"), league::WeekType::kUnknown);
    EXPECT_EQ(league::ParseDivisionType("ECS FC"), league::DivisionType::kEcsFc);
    EXPECT_EQ(league::ParseDivisionType("ecs-fc"), league::DivisionType::kEcsFc);
    EXPECT_EQ(league::ParseDivisionType("Premier"), league::DivisionType::kPremier);
    EXPECT_EQ(league::ParseDivisionType("sunday"), league::DivisionType::kOther);
}

}  // namespace
}  // namespace leaguesched::core::season
