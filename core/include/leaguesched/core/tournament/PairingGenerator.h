#pragma once

#include "leaguesched/core/league/LeagueTypes.h"
#include "leaguesched/core/league/ScheduleError.h"
#include "leaguesched/core/tournament/PairingTable.h"
#include "leaguesched/core/util/LogSink.h"
#include "leaguesched/core/validation/ConstraintValidator.h"
#include "leaguesched/core/validation/ViolationReport.h"

#include <map>
#include <set>
#include <utility>
#include <vector>

namespace leaguesched::core::tournament {

// Running counters for one generation run.
struct PairingState {
    std::map<int, std::set<int>> opponent_history;
    std::map<int, int> home_count;
    std::map<int, int> away_count;
    std::map<std::pair<int, int>, int> pair_count;
    validation::OpponentMap last_week_opponents;

    void Record(const league::WeekPairings& week);
};

struct SeasonPairings {
    std::vector<league::WeekPairings> weeks;
    validation::ViolationReport report;
    int retried_weeks = 0;
};

class PairingGenerator {
public:
    static constexpr int kMaxRetryAttempts = 3;

    explicit PairingGenerator(util::LogFn log_fn = {});
    PairingGenerator(const PremierWeekTable& premier_table, util::LogFn log_fn = {});

    bool Generate(const std::vector<int>& team_ids,
                  int weeks_count,
                  SeasonPairings& out,
                  league::ScheduleError* error) const;

    // One week of the 8-team table; week_num must be in [0, 6].
    bool BuildPremierWeek(const std::vector<int>& team_ids,
                          int week_num,
                          league::WeekPairings& out,
                          league::ScheduleError* error) const;

    static league::WeekPairings BuildClassicWeek(const std::vector<int>& sorted_ids, int week_num);

private:
    void GeneratePremier(const std::vector<int>& sorted_ids, int weeks_count, SeasonPairings& out) const;
    void GenerateClassic(const std::vector<int>& sorted_ids, int weeks_count, SeasonPairings& out) const;
    league::WeekPairings RotatedPremierWeek(const std::vector<int>& sorted_ids, int week_num, int shift) const;

    PremierWeekTable premier_table_;
    util::LogFn log_fn_;
    validation::ConstraintValidator validator_;
};

}  // namespace leaguesched::core::tournament
