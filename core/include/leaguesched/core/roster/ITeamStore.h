#pragma once

#include "leaguesched/core/league/LeagueTypes.h"

#include <optional>
#include <vector>

namespace leaguesched::core::roster {

class ITeamStore {
public:
    virtual ~ITeamStore() = default;
    virtual std::vector<league::Team> TeamsInDivision(int division_id) = 0;
    virtual std::optional<league::Team> FindTeam(int team_id) = 0;
};

}  // namespace leaguesched::core::roster
