#pragma once

#include "leaguesched/core/league/LeagueTypes.h"
#include "leaguesched/core/util/LogSink.h"
#include "leaguesched/core/validation/ViolationReport.h"

#include <map>
#include <set>
#include <vector>

namespace leaguesched::core::validation {

using OpponentMap = std::map<int, std::set<int>>;

OpponentMap OpponentsOf(const league::WeekPairings& week);

class ConstraintValidator {
public:
    explicit ConstraintValidator(util::LogFn log_fn = {});

    // C2: every team listed in the week plays exactly two matches.
    // C3: no team meets an opponent it met in the prior week.
    bool ValidateWeek(const league::WeekPairings& matches,
                      const OpponentMap& prior_week_opponents,
                      int week_index,
                      ViolationReport* report) const;

    // C1 and C4 over a complete season. 8-team seasons are checked only when
    // all 7 weeks are present; 4-team seasons per complete 3-week block.
    ViolationReport ValidateFinalSchedule(const std::vector<league::WeekPairings>& weeks) const;

    // Window placement (hard), field balance C5 and window balance C6
    // (advisory) over time-slotted weeks.
    ViolationReport ValidateAssignments(const std::vector<league::WeekAssignments>& weeks,
                                        const std::vector<util::ClockTime>& time_slots) const;

private:
    void Record(ViolationReport& report,
                Constraint constraint,
                Severity severity,
                int week_index,
                const std::string& message) const;

    void CheckPairCounts(const std::vector<league::WeekPairings>& weeks,
                         size_t first_week,
                         size_t week_count,
                         const std::vector<int>& teams,
                         ViolationReport& report) const;
    void CheckHomeAway(const std::vector<league::WeekPairings>& weeks,
                       size_t week_count,
                       const std::vector<int>& teams,
                       ViolationReport& report) const;

    util::LogFn log_fn_;
};

}  // namespace leaguesched::core::validation
