#include "leaguesched/core/roster/RosterResolver.h"

#include <algorithm>

namespace leaguesched::core::roster {

bool IsPlaceholderName(const std::string& name) {
    return std::find(kPlaceholderNames.begin(), kPlaceholderNames.end(), name) != kPlaceholderNames.end();
}

RosterResolver::RosterResolver(std::vector<league::Team> division_teams, ITeamStore* store)
    : store_(store) {
    std::vector<league::Team> legacy_rows;
    for (auto& team : division_teams) {
        if (IsPlaceholderName(team.name)) {
            legacy_rows.push_back(std::move(team));
        } else {
            real_teams_.push_back(std::move(team));
        }
    }

    const int division_id = real_teams_.empty() ? 0 : real_teams_.front().division_id;
    int next_virtual_id = kFirstPlaceholderId;
    for (const auto& name : kPlaceholderNames) {
        const auto legacy = std::find_if(legacy_rows.begin(), legacy_rows.end(),
                                         [&](const league::Team& team) { return team.name == name; });
        if (legacy != legacy_rows.end()) {
            placeholders_.push_back(*legacy);
            continue;
        }
        league::Team placeholder;
        placeholder.id = next_virtual_id--;
        placeholder.name = name;
        placeholder.division_id = division_id;
        placeholders_.push_back(std::move(placeholder));
    }
}

RosterResolver RosterResolver::FromStore(ITeamStore& store, int division_id) {
    return RosterResolver(store.TeamsInDivision(division_id), &store);
}

std::vector<int> RosterResolver::real_team_ids() const {
    std::vector<int> ids;
    ids.reserve(real_teams_.size());
    for (const auto& team : real_teams_) {
        ids.push_back(team.id);
    }
    return ids;
}

std::optional<league::Team> RosterResolver::FindTeam(int team_id) const {
    if (team_id < 0) {
        for (const auto& placeholder : placeholders_) {
            if (placeholder.id == team_id) {
                return placeholder;
            }
        }
        return std::nullopt;
    }
    for (const auto& team : real_teams_) {
        if (team.id == team_id) {
            return team;
        }
    }
    // Legacy placeholder rows keep their positive ids.
    for (const auto& placeholder : placeholders_) {
        if (placeholder.id == team_id) {
            return placeholder;
        }
    }
    if (store_) {
        return store_->FindTeam(team_id);
    }
    return std::nullopt;
}

std::optional<league::Team> RosterResolver::PlaceholderByName(const std::string& name) const {
    for (const auto& placeholder : placeholders_) {
        if (placeholder.name == name) {
            return placeholder;
        }
    }
    return std::nullopt;
}

std::optional<league::Team> RosterResolver::PlaceholderFor(league::WeekType week_type) const {
    switch (week_type) {
        case league::WeekType::kFun:
            return PlaceholderByName("FUN WEEK");
        case league::WeekType::kTst:
            return PlaceholderByName("TST");
        case league::WeekType::kBye:
            return PlaceholderByName("BYE");
        default:
            break;
    }
    return std::nullopt;
}

}  // namespace leaguesched::core::roster
