#pragma once

#include "leaguesched/core/league/LeagueTypes.h"
#include "leaguesched/core/util/CalendarDate.h"

#include <vector>

namespace leaguesched::core::season {

struct SeasonConfiguration {
    league::DivisionType division_type = league::DivisionType::kOther;
    int regular_season_weeks = 8;
    int playoff_weeks = 1;
    bool has_fun_week = false;
    bool has_tst_week = false;
    bool has_bonus_week = false;
    bool has_practice_sessions = false;
    // 1-based positions among the regular weeks.
    std::vector<int> practice_weeks;

    static SeasonConfiguration DefaultsFor(league::DivisionType type);
};

// Lays the season out as: first half of the regular weeks, FUN, the rest of
// the regular weeks, TST, playoff rounds, BONUS. Weeks are days_between days
// apart starting at start_date.
std::vector<league::WeekDescriptor> BuildWeekDescriptors(const SeasonConfiguration& config,
                                                         const util::CalendarDate& start_date,
                                                         int days_between = 7);

}  // namespace leaguesched::core::season
