#pragma once

#include "leaguesched/core/league/LeagueTypes.h"

#include <string>

namespace leaguesched::core::lifecycle {

struct MatchRequest {
    util::CalendarDate date;
    util::ClockTime time;
    std::string field;
    int home_team_id = 0;
    int away_team_id = 0;
    int week_number = 0;
    league::WeekType week_type = league::WeekType::kRegular;
    bool is_special = false;
    bool is_playoff = false;
    int playoff_round = 0;
};

class IMatchCreator {
public:
    virtual ~IMatchCreator() = default;
    virtual bool CreateMatch(const MatchRequest& request, int* match_id, std::string* error) = 0;
};

}  // namespace leaguesched::core::lifecycle
