#include "leaguesched/core/season/SeasonConfiguration.h"

#include <algorithm>

namespace leaguesched::core::season {

SeasonConfiguration SeasonConfiguration::DefaultsFor(league::DivisionType type) {
    SeasonConfiguration config;
    config.division_type = type;
    switch (type) {
        case league::DivisionType::kPremier:
            config.regular_season_weeks = 7;
            config.playoff_weeks = 2;
            config.has_fun_week = true;
            config.has_tst_week = true;
            config.has_bonus_week = true;
            break;
        case league::DivisionType::kClassic:
            config.regular_season_weeks = 8;
            config.playoff_weeks = 1;
            config.practice_weeks = {1, 2};
            break;
        case league::DivisionType::kEcsFc:
        case league::DivisionType::kOther:
            config.regular_season_weeks = 8;
            config.playoff_weeks = 1;
            break;
    }
    return config;
}

std::vector<league::WeekDescriptor> BuildWeekDescriptors(const SeasonConfiguration& config,
                                                         const util::CalendarDate& start_date,
                                                         int days_between) {
    std::vector<league::WeekDescriptor> weeks;
    int order = 0;
    const auto add_week = [&](league::WeekType type) -> league::WeekDescriptor& {
        league::WeekDescriptor week;
        week.date = start_date.AddDays(order * days_between);
        week.week_type = type;
        week.week_type_tag = league::ToString(type);
        week.week_order = ++order;
        weeks.push_back(std::move(week));
        return weeks.back();
    };

    const int regular = std::max(config.regular_season_weeks, 0);
    const int first_half = (regular + 1) / 2;
    const bool practice_enabled =
        config.has_practice_sessions && config.division_type == league::DivisionType::kClassic;
    const auto add_regular = [&](int regular_index) {
        auto& week = add_week(league::WeekType::kRegular);
        week.is_practice_session =
            practice_enabled && std::find(config.practice_weeks.begin(), config.practice_weeks.end(),
                                          regular_index) != config.practice_weeks.end();
    };

    for (int i = 1; i <= first_half; ++i) {
        add_regular(i);
    }
    if (config.has_fun_week) {
        add_week(league::WeekType::kFun);
    }
    for (int i = first_half + 1; i <= regular; ++i) {
        add_regular(i);
    }
    if (config.has_tst_week) {
        add_week(league::WeekType::kTst);
    }
    for (int round = 1; round <= config.playoff_weeks; ++round) {
        add_week(league::WeekType::kPlayoff).playoff_round = round;
    }
    if (config.has_bonus_week) {
        add_week(league::WeekType::kBonus);
    }
    return weeks;
}

}  // namespace leaguesched::core::season
