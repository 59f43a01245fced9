#pragma once

#include "leaguesched/core/league/LeagueTypes.h"
#include "leaguesched/core/util/CalendarDate.h"

#include <map>
#include <string>
#include <vector>

namespace leaguesched::core::schedule {

std::vector<std::string> DefaultFields();

// Early/late window and field usage per team, accumulated over one run.
struct SlotHistory {
    int season_weeks = 7;
    std::map<int, int> early_weeks;
    std::map<int, int> late_weeks;
    // Diagnostic only: Assign alternates fields by match index and never
    // reads these counts.
    std::map<int, std::map<std::string, int>> field_counts;

    void Record(const league::WeekAssignments& assignments, const std::vector<util::ClockTime>& time_slots);
};

class SlotAssigner {
public:
    static constexpr int kDefaultMatchMinutes = 70;

    // PREMIER: 08:20 09:30 10:40 11:50. CLASSIC: 13:10 14:20. Other divisions
    // get one slot per two matches from start_time, match_minutes apart.
    static std::vector<util::ClockTime> DivisionTimeSlots(league::DivisionType type,
                                                          size_t match_count,
                                                          util::ClockTime start_time = {8, 0},
                                                          int match_minutes = kDefaultMatchMinutes);

    static league::WeekAssignments Assign(const league::WeekPairings& matches,
                                          const std::vector<util::ClockTime>& time_slots,
                                          const std::vector<std::string>& fields);

    // Swaps the early and late windows of an 8-match, 4-slot week when an
    // early-window team would exceed its share of early weeks and the swap
    // keeps everybody within their share. Records the final week in history.
    // Returns true when the windows were swapped.
    static bool BalancePremierTimeSlots(league::WeekAssignments& assignments,
                                        const std::vector<util::ClockTime>& time_slots,
                                        SlotHistory& history);
};

}  // namespace leaguesched::core::schedule
