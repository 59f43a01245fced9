#include <gtest/gtest.h>

#include "leaguesched/core/schedule/SlotAssigner.h"
#include "leaguesched/core/tournament/PairingGenerator.h"
#include "leaguesched/core/validation/ConstraintValidator.h"

#include <map>

namespace leaguesched::core::schedule {
namespace {

util::LogFn Quiet() {
    return [](const std::string&) {};
}

std::vector<league::WeekPairings> PremierSeason() {
    tournament::PairingGenerator generator(Quiet());
    tournament::SeasonPairings season;
    league::ScheduleError error;
    EXPECT_TRUE(generator.Generate({1, 2, 3, 4, 5, 6, 7, 8}, 7, season, &error));
    return season.weeks;
}

TEST(SlotAssignerTest, DivisionTimeSlots) {
    const auto premier = SlotAssigner::DivisionTimeSlots(league::DivisionType::kPremier, 8);
    ASSERT_EQ(premier.size(), 4u);
    EXPECT_EQ(premier[0].ToString(), "08:20");
    EXPECT_EQ(premier[1].ToString(), "09:30");
    EXPECT_EQ(premier[2].ToString(), "10:40");
    EXPECT_EQ(premier[3].ToString(), "11:50");

    const auto classic = SlotAssigner::DivisionTimeSlots(league::DivisionType::kClassic, 4);
    ASSERT_EQ(classic.size(), 2u);
    EXPECT_EQ(classic[0].ToString(), "13:10");
    EXPECT_EQ(classic[1].ToString(), "14:20");

    const auto other = SlotAssigner::DivisionTimeSlots(league::DivisionType::kEcsFc, 5, {9, 0}, 60);
    ASSERT_EQ(other.size(), 3u);
    EXPECT_EQ(other[2].ToString(), "11:00");
}

TEST(SlotAssignerTest, AssignsTwoMatchesPerSlotAcrossFields) {
    const league::WeekPairings week = {{1, 2}, {3, 4}, {1, 3}, {2, 4}};
    const auto slots = SlotAssigner::DivisionTimeSlots(league::DivisionType::kClassic, week.size());
    const auto assignments = SlotAssigner::Assign(week, slots, DefaultFields());

    ASSERT_EQ(assignments.size(), 4u);
    EXPECT_EQ(assignments[0].time.ToString(), "13:10");
    EXPECT_EQ(assignments[1].time.ToString(), "13:10");
    EXPECT_EQ(assignments[2].time.ToString(), "14:20");
    EXPECT_EQ(assignments[0].field, "North");
    EXPECT_EQ(assignments[1].field, "South");
    EXPECT_EQ(assignments[2].field, "North");
    EXPECT_EQ(assignments[0].match_order, 1);
    EXPECT_EQ(assignments[2].match_order, 2);
    EXPECT_EQ(assignments[3].match_order, 2);
}

// -----------------------------------------------------------------------------
// Every team plays back-to-back inside one window, every regular week
// -----------------------------------------------------------------------------
TEST(SlotAssignerTest, PremierSeasonKeepsBackToBackWindows) {
    const auto slots = SlotAssigner::DivisionTimeSlots(league::DivisionType::kPremier, 8);
    SlotHistory history;
    std::vector<league::WeekAssignments> weeks;
    for (const auto& pairing : PremierSeason()) {
        auto assignments = SlotAssigner::Assign(pairing, slots, DefaultFields());
        EXPECT_FALSE(SlotAssigner::BalancePremierTimeSlots(assignments, slots, history));
        weeks.push_back(std::move(assignments));
    }

    for (const auto& week : weeks) {
        std::map<int, std::vector<util::ClockTime>> times;
        for (const auto& assignment : week) {
            times[assignment.home_team_id].push_back(assignment.time);
            times[assignment.away_team_id].push_back(assignment.time);
        }
        ASSERT_EQ(times.size(), 8u);
        for (const auto& [team, played] : times) {
            ASSERT_EQ(played.size(), 2u);
            const bool early = played[0] == slots[0] && played[1] == slots[1];
            const bool late = played[0] == slots[2] && played[1] == slots[3];
            EXPECT_TRUE(early || late) << "team " << team;
        }
    }

    validation::ConstraintValidator validator(Quiet());
    const auto report = validator.ValidateAssignments(weeks, slots);
    EXPECT_TRUE(report.empty());
}

TEST(SlotAssignerTest, PremierSeasonBalancesFieldsAndWindows) {
    const auto slots = SlotAssigner::DivisionTimeSlots(league::DivisionType::kPremier, 8);
    SlotHistory history;
    for (const auto& pairing : PremierSeason()) {
        auto assignments = SlotAssigner::Assign(pairing, slots, DefaultFields());
        SlotAssigner::BalancePremierTimeSlots(assignments, slots, history);
    }
    for (int team = 1; team <= 8; ++team) {
        EXPECT_EQ(history.field_counts[team]["North"], 7) << "team " << team;
        EXPECT_EQ(history.field_counts[team]["South"], 7) << "team " << team;
        const int early = history.early_weeks[team];
        const int late = history.late_weeks[team];
        EXPECT_EQ(early + late, 7);
        EXPECT_EQ(early, team <= 4 ? 4 : 3) << "team " << team;
    }
}

TEST(SlotAssignerTest, BalancingSwapsWindowsForOverusedEarlyTeams) {
    const auto slots = SlotAssigner::DivisionTimeSlots(league::DivisionType::kPremier, 8);
    const league::WeekPairings week = {{1, 2}, {3, 4}, {1, 3}, {2, 4}, {5, 6}, {7, 8}, {5, 7}, {6, 8}};
    SlotHistory history;
    for (int team = 1; team <= 4; ++team) {
        history.early_weeks[team] = 4;
    }
    for (int team = 5; team <= 8; ++team) {
        history.late_weeks[team] = 3;
    }

    auto assignments = SlotAssigner::Assign(week, slots, DefaultFields());
    ASSERT_TRUE(SlotAssigner::BalancePremierTimeSlots(assignments, slots, history));

    EXPECT_EQ(assignments.front().home_team_id, 5);
    EXPECT_EQ(assignments.front().time, slots[0]);
    EXPECT_EQ(assignments.back().home_team_id, 2);
    EXPECT_EQ(assignments.back().time, slots[3]);
    EXPECT_EQ(history.early_weeks[5], 1);
    EXPECT_EQ(history.late_weeks[1], 1);
    EXPECT_EQ(history.early_weeks[1], 4);
}

TEST(SlotAssignerTest, BalancingKeepsWeekWhenSwapWouldOverflow) {
    const auto slots = SlotAssigner::DivisionTimeSlots(league::DivisionType::kPremier, 8);
    const league::WeekPairings week = {{1, 2}, {3, 4}, {1, 3}, {2, 4}, {5, 6}, {7, 8}, {5, 7}, {6, 8}};
    SlotHistory history;
    history.early_weeks[1] = 4;
    history.early_weeks[5] = 4;

    auto assignments = SlotAssigner::Assign(week, slots, DefaultFields());
    EXPECT_FALSE(SlotAssigner::BalancePremierTimeSlots(assignments, slots, history));
    EXPECT_EQ(assignments.front().home_team_id, 1);
    EXPECT_EQ(history.early_weeks[1], 5);
}

}  // namespace
}  // namespace leaguesched::core::schedule
