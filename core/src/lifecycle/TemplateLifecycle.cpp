#include "leaguesched/core/lifecycle/TemplateLifecycle.h"

#include <algorithm>
#include <utility>

namespace leaguesched::core::lifecycle {

namespace {

MatchRequest RequestFor(const league::ScheduleTemplateRow& row) {
    MatchRequest request;
    request.date = row.scheduled_date;
    request.time = row.scheduled_time;
    request.field = row.field_name;
    request.home_team_id = row.home_team_id;
    request.away_team_id = row.away_team_id;
    request.week_number = row.week_number;
    request.week_type = row.week_type;
    request.is_special = row.is_special_week;
    request.is_playoff = row.is_playoff;
    request.playoff_round = row.playoff_round;
    return request;
}

std::string TeamName(const roster::RosterResolver* roster, int team_id) {
    if (!roster) {
        return "Unknown";
    }
    const auto team = roster->FindTeam(team_id);
    return team ? team->name : "Unknown";
}

}  // namespace

SchedulePreview BuildPreview(const std::vector<league::ScheduleTemplateRow>& rows,
                             const roster::RosterResolver* roster) {
    SchedulePreview preview;
    for (const auto& row : rows) {
        PreviewEntry entry;
        entry.template_id = row.id;
        entry.week_number = row.week_number;
        entry.date = row.scheduled_date;
        entry.time = row.scheduled_time;
        entry.field = row.field_name;
        entry.home_team_id = row.home_team_id;
        entry.away_team_id = row.away_team_id;
        entry.home_team_name = TeamName(roster, row.home_team_id);
        entry.away_team_name = TeamName(roster, row.away_team_id);
        entry.week_type = row.week_type;
        entry.is_special = row.is_special_week;
        entry.is_practice = row.is_practice;
        entry.is_playoff = row.is_playoff;
        entry.playoff_round = row.playoff_round;
        preview[row.week_number].push_back(std::move(entry));
    }
    for (auto& [week, entries] : preview) {
        std::stable_sort(entries.begin(), entries.end(), [](const auto& a, const auto& b) {
            if (a.time != b.time) {
                return a.time < b.time;
            }
            return a.field < b.field;
        });
    }
    return preview;
}

TemplateLifecycle::TemplateLifecycle(ITemplateStore& store,
                                     IMatchCreator* match_creator,
                                     const roster::RosterResolver* roster,
                                     util::LogFn log_fn)
    : store_(store), match_creator_(match_creator), roster_(roster), log_fn_(std::move(log_fn)) {}

void TemplateLifecycle::Log(const std::string& line) const {
    util::EmitLog(log_fn_, "[leaguesched] " + line);
}

SchedulePreview TemplateLifecycle::Preview(int division_id) const {
    return BuildPreview(store_.UncommittedRows(division_id), roster_);
}

bool TemplateLifecycle::Persist(std::vector<league::ScheduleTemplateRow>& rows, league::ScheduleError* error) {
    for (auto& row : rows) {
        row.is_committed = false;
    }
    std::string store_error;
    if (!store_.InsertRows(rows, &store_error)) {
        return league::SetError(error, league::ScheduleErrorCode::kStoreFailure,
                                "Failed to persist templates: " + store_error);
    }
    Log("Persisted " + std::to_string(rows.size()) + " templates");
    return true;
}

std::vector<league::ScheduleTemplateRow> TemplateLifecycle::TargetRows(
    int division_id,
    const std::optional<std::vector<int>>& template_ids) const {
    if (!template_ids) {
        return store_.UncommittedRows(division_id);
    }
    std::vector<league::ScheduleTemplateRow> targets;
    for (auto& row : store_.FindRows(*template_ids)) {
        if (row.division_id != division_id) {
            Log("Template " + std::to_string(row.id) + " belongs to another division; skipped");
            continue;
        }
        if (row.is_committed) {
            Log("Template " + std::to_string(row.id) + " is already committed; skipped");
            continue;
        }
        targets.push_back(std::move(row));
    }
    return targets;
}

bool TemplateLifecycle::Commit(int division_id,
                               const std::optional<std::vector<int>>& template_ids,
                               league::ScheduleError* error) {
    auto rows = TargetRows(division_id, template_ids);
    if (rows.empty()) {
        Log("No uncommitted templates for division " + std::to_string(division_id));
        return true;
    }
    if (!match_creator_) {
        return league::SetError(error, league::ScheduleErrorCode::kStoreFailure,
                                "No match creator configured");
    }

    // Create every match first; flags are only flipped once all succeeded.
    for (const auto& row : rows) {
        int match_id = 0;
        std::string create_error;
        if (!match_creator_->CreateMatch(RequestFor(row), &match_id, &create_error)) {
            return league::SetError(error, league::ScheduleErrorCode::kStoreFailure,
                                    "Failed to create match for template " + std::to_string(row.id) + ": " +
                                        create_error);
        }
    }

    for (auto& row : rows) {
        row.is_committed = true;
    }
    std::string store_error;
    if (!store_.UpdateRows(rows, &store_error)) {
        return league::SetError(error, league::ScheduleErrorCode::kStoreFailure,
                                "Failed to mark templates committed: " + store_error);
    }
    Log("Committed " + std::to_string(rows.size()) + " templates for division " + std::to_string(division_id));
    return true;
}

bool TemplateLifecycle::Delete(int division_id,
                               const std::optional<std::vector<int>>& template_ids,
                               league::ScheduleError* error) {
    const auto rows = TargetRows(division_id, template_ids);
    if (rows.empty()) {
        return true;
    }
    std::vector<int> ids;
    ids.reserve(rows.size());
    for (const auto& row : rows) {
        ids.push_back(row.id);
    }
    std::string store_error;
    if (!store_.RemoveRows(ids, &store_error)) {
        return league::SetError(error, league::ScheduleErrorCode::kStoreFailure,
                                "Failed to delete templates: " + store_error);
    }
    Log("Deleted " + std::to_string(ids.size()) + " templates for division " + std::to_string(division_id));
    return true;
}

bool TemplateLifecycle::SwapTeams(int template_id_1, int template_id_2, league::ScheduleError* error) {
    auto rows = store_.FindRows({template_id_1, template_id_2});
    const auto find = [&](int id) {
        return std::find_if(rows.begin(), rows.end(), [id](const auto& row) { return row.id == id; });
    };
    const auto first = find(template_id_1);
    const auto second = find(template_id_2);
    if (template_id_1 == template_id_2 || first == rows.end() || second == rows.end()) {
        return league::SetError(error, league::ScheduleErrorCode::kStoreFailure,
                                "One or both templates not found");
    }
    if (first->is_committed || second->is_committed) {
        return league::SetError(error, league::ScheduleErrorCode::kStoreFailure,
                                "Committed templates cannot be changed");
    }

    std::swap(first->home_team_id, second->home_team_id);
    std::swap(first->away_team_id, second->away_team_id);
    std::string store_error;
    if (!store_.UpdateRows({*first, *second}, &store_error)) {
        return league::SetError(error, league::ScheduleErrorCode::kStoreFailure,
                                "Failed to swap teams: " + store_error);
    }
    return true;
}

}  // namespace leaguesched::core::lifecycle
