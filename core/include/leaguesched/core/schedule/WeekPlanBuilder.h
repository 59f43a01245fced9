#pragma once

#include "leaguesched/core/league/LeagueTypes.h"
#include "leaguesched/core/league/ScheduleError.h"
#include "leaguesched/core/roster/RosterResolver.h"
#include "leaguesched/core/schedule/SlotAssigner.h"
#include "leaguesched/core/util/LogSink.h"

#include <string>
#include <vector>

namespace leaguesched::core::schedule {

struct WeekPlanSettings {
    league::DivisionType division_type = league::DivisionType::kOther;
    int division_id = 0;
    std::vector<std::string> fields = DefaultFields();
    // Only used by divisions without fixed clock times.
    util::ClockTime start_time{8, 0};
    int match_minutes = SlotAssigner::kDefaultMatchMinutes;
};

struct WeekPlanResult {
    std::vector<league::ScheduleTemplateRow> rows;
    // Full regular weeks, in season order, for window and field validation.
    std::vector<league::WeekAssignments> regular_weeks;
    std::vector<util::ClockTime> regular_time_slots;
    SlotHistory history;
    int pairings_used = 0;
    int skipped_weeks = 0;
};

class WeekPlanBuilder {
public:
    WeekPlanBuilder(const roster::RosterResolver& roster, WeekPlanSettings settings, util::LogFn log_fn = {});

    bool Build(const std::vector<league::WeekDescriptor>& weeks,
               const std::vector<league::WeekPairings>& pairings,
               WeekPlanResult& out,
               league::ScheduleError* error) const;

private:
    bool RequireDate(const league::WeekDescriptor& week, league::ScheduleError* error) const;
    const league::WeekPairings* NextPairing(const league::WeekDescriptor& week,
                                            const std::vector<league::WeekPairings>& pairings,
                                            WeekPlanResult& out) const;

    void EmitRegularWeek(const league::WeekDescriptor& week, const league::WeekPairings& pairing,
                         WeekPlanResult& out) const;
    void EmitPracticeWeek(const league::WeekDescriptor& week, const league::WeekPairings& pairing,
                          league::WeekType practice_tag, WeekPlanResult& out) const;
    void EmitPlaceholderWeek(const league::WeekDescriptor& week, league::WeekType row_type,
                             WeekPlanResult& out) const;

    league::ScheduleTemplateRow MakeRow(const league::WeekDescriptor& week, league::WeekType row_type) const;
    std::vector<util::ClockTime> TimeSlotsFor(size_t match_count) const;
    void Log(const std::string& line) const;

    const roster::RosterResolver& roster_;
    WeekPlanSettings settings_;
    util::LogFn log_fn_;
};

}  // namespace leaguesched::core::schedule
