#pragma once

#include "leaguesched/core/league/LeagueTypes.h"
#include "leaguesched/core/league/ScheduleError.h"
#include "leaguesched/core/lifecycle/IMatchCreator.h"
#include "leaguesched/core/lifecycle/ITemplateStore.h"
#include "leaguesched/core/roster/RosterResolver.h"
#include "leaguesched/core/util/LogSink.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace leaguesched::core::lifecycle {

struct PreviewEntry {
    int template_id = 0;
    int week_number = 0;
    util::CalendarDate date;
    util::ClockTime time;
    std::string field;
    int home_team_id = 0;
    int away_team_id = 0;
    std::string home_team_name;
    std::string away_team_name;
    league::WeekType week_type = league::WeekType::kRegular;
    bool is_special = false;
    bool is_practice = false;
    bool is_playoff = false;
    int playoff_round = 0;
};

using SchedulePreview = std::map<int, std::vector<PreviewEntry>>;

// Groups rows by week number, ordered by time then field. Names fall back to
// "Unknown" when roster is null or does not know the team.
SchedulePreview BuildPreview(const std::vector<league::ScheduleTemplateRow>& rows,
                             const roster::RosterResolver* roster);

class TemplateLifecycle {
public:
    // match_creator may be null when Commit is never called. roster resolves
    // names for Preview; without one every name is "Unknown".
    TemplateLifecycle(ITemplateStore& store,
                      IMatchCreator* match_creator,
                      const roster::RosterResolver* roster,
                      util::LogFn log_fn = {});

    SchedulePreview Preview(int division_id) const;

    bool Persist(std::vector<league::ScheduleTemplateRow>& rows, league::ScheduleError* error);

    // Without template_ids every uncommitted row of the division is targeted.
    bool Commit(int division_id,
                const std::optional<std::vector<int>>& template_ids,
                league::ScheduleError* error);
    bool Delete(int division_id,
                const std::optional<std::vector<int>>& template_ids,
                league::ScheduleError* error);

    bool SwapTeams(int template_id_1, int template_id_2, league::ScheduleError* error);

private:
    std::vector<league::ScheduleTemplateRow> TargetRows(int division_id,
                                                        const std::optional<std::vector<int>>& template_ids) const;
    void Log(const std::string& line) const;

    ITemplateStore& store_;
    IMatchCreator* match_creator_ = nullptr;
    const roster::RosterResolver* roster_ = nullptr;
    util::LogFn log_fn_;
};

}  // namespace leaguesched::core::lifecycle
