#pragma once

#include "leaguesched/core/league/LeagueTypes.h"
#include "leaguesched/core/roster/ITeamStore.h"

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace leaguesched::core::roster {

inline constexpr int kFirstPlaceholderId = -1000;

// Names of legacy placeholder rows, in the order their virtual ids are handed
// out.
inline const std::array<std::string, 3> kPlaceholderNames = {"FUN WEEK", "BYE", "TST"};

bool IsPlaceholderName(const std::string& name);

class RosterResolver {
public:
    explicit RosterResolver(std::vector<league::Team> division_teams,
                            ITeamStore* store = nullptr);

    // Resolves the division roster as the store lists it; later lookups fall
    // back to the same store.
    static RosterResolver FromStore(ITeamStore& store, int division_id);

    const std::vector<league::Team>& real_teams() const { return real_teams_; }
    const std::vector<league::Team>& placeholder_teams() const { return placeholders_; }
    std::vector<int> real_team_ids() const;

    std::optional<league::Team> FindTeam(int team_id) const;
    std::optional<league::Team> PlaceholderByName(const std::string& name) const;
    // FUN, TST and BYE map to their placeholder team; other week types have none.
    std::optional<league::Team> PlaceholderFor(league::WeekType week_type) const;

private:
    std::vector<league::Team> real_teams_;
    std::vector<league::Team> placeholders_;
    ITeamStore* store_ = nullptr;
};

}  // namespace leaguesched::core::roster
