#include "leaguesched/core/tournament/PairingGenerator.h"

#include <algorithm>
#include <sstream>

namespace leaguesched::core::tournament {

namespace {

std::vector<int> SortedIds(const std::vector<int>& team_ids) {
    auto sorted = team_ids;
    std::sort(sorted.begin(), sorted.end());
    return sorted;
}

}  // namespace

void PairingState::Record(const league::WeekPairings& week) {
    for (const auto& match : week) {
        if (match.is_placeholder()) {
            continue;
        }
        opponent_history[match.home_team_id].insert(match.away_team_id);
        opponent_history[match.away_team_id].insert(match.home_team_id);
        home_count[match.home_team_id] += 1;
        away_count[match.away_team_id] += 1;
        const int low = std::min(match.home_team_id, match.away_team_id);
        const int high = std::max(match.home_team_id, match.away_team_id);
        pair_count[{low, high}] += 1;
    }
    last_week_opponents = validation::OpponentsOf(week);
}

PairingGenerator::PairingGenerator(util::LogFn log_fn)
    : PairingGenerator(kPremierTable, std::move(log_fn)) {}

PairingGenerator::PairingGenerator(const PremierWeekTable& premier_table, util::LogFn log_fn)
    : premier_table_(premier_table),
      log_fn_(log_fn),
      validator_(std::move(log_fn)) {}

bool PairingGenerator::Generate(const std::vector<int>& team_ids,
                                int weeks_count,
                                SeasonPairings& out,
                                league::ScheduleError* error) const {
    out = SeasonPairings{};
    const int team_count = static_cast<int>(team_ids.size());
    if (team_count != kClassicTeamCount && team_count != kPremierTeamCount) {
        std::ostringstream message;
        message << "Pairings need exactly 4 or 8 teams, got " << team_count;
        return league::SetError(error, league::ScheduleErrorCode::kInvalidTeamCount, message.str());
    }
    if (team_count == kPremierTeamCount && weeks_count > kPremierWeekCount) {
        std::ostringstream message;
        message << "8-team seasons have at most " << kPremierWeekCount << " regular weeks, asked for "
                << weeks_count;
        return league::SetError(error, league::ScheduleErrorCode::kInvalidWeekNumber, message.str());
    }

    const auto sorted_ids = SortedIds(team_ids);
    const int weeks = std::max(weeks_count, 0);
    if (team_count == kPremierTeamCount) {
        GeneratePremier(sorted_ids, weeks, out);
    } else {
        GenerateClassic(sorted_ids, weeks, out);
    }

    out.report.Merge(validator_.ValidateFinalSchedule(out.weeks));

    std::ostringstream summary;
    summary << "[pairing] Generated " << out.weeks.size() << " weeks for " << team_count << " teams ("
            << out.retried_weeks << " retried, " << out.report.hard_count() << " hard violations)";
    util::EmitLog(log_fn_, summary.str());
    return true;
}

bool PairingGenerator::BuildPremierWeek(const std::vector<int>& team_ids,
                                        int week_num,
                                        league::WeekPairings& out,
                                        league::ScheduleError* error) const {
    if (static_cast<int>(team_ids.size()) != kPremierTeamCount) {
        return league::SetError(error, league::ScheduleErrorCode::kInvalidTeamCount,
                                "The 8-team table needs exactly 8 teams");
    }
    if (week_num < 0 || week_num >= kPremierWeekCount) {
        std::ostringstream message;
        message << "Week number " << week_num << " is outside [0, " << (kPremierWeekCount - 1) << "]";
        return league::SetError(error, league::ScheduleErrorCode::kInvalidWeekNumber, message.str());
    }
    out = RotatedPremierWeek(SortedIds(team_ids), week_num, 0);
    return true;
}

league::WeekPairings PairingGenerator::BuildClassicWeek(const std::vector<int>& sorted_ids, int week_num) {
    league::WeekPairings week;
    const auto& pattern = kClassicRotation[static_cast<size_t>(week_num % kClassicCycleLength)];
    week.reserve(pattern.size());
    for (const auto& pair : pattern) {
        week.push_back({sorted_ids[static_cast<size_t>(pair.home)], sorted_ids[static_cast<size_t>(pair.away)]});
    }
    return week;
}

league::WeekPairings PairingGenerator::RotatedPremierWeek(const std::vector<int>& sorted_ids,
                                                          int week_num,
                                                          int shift) const {
    league::WeekPairings week;
    const auto& row = premier_table_[static_cast<size_t>(week_num)];
    week.reserve(row.size());
    for (const auto& pair : row) {
        const int home = (pair.home + shift) % kPremierTeamCount;
        const int away = (pair.away + shift) % kPremierTeamCount;
        week.push_back({sorted_ids[static_cast<size_t>(home)], sorted_ids[static_cast<size_t>(away)]});
    }
    return week;
}

void PairingGenerator::GeneratePremier(const std::vector<int>& sorted_ids,
                                       int weeks_count,
                                       SeasonPairings& out) const {
    PairingState state;
    for (int week = 0; week < weeks_count; ++week) {
        auto candidate = RotatedPremierWeek(sorted_ids, week, 0);
        validation::ViolationReport first_attempt;
        if (!validator_.ValidateWeek(candidate, state.last_week_opponents, week, &first_attempt)) {
            bool accepted = false;
            for (int attempt = 1; attempt <= kMaxRetryAttempts && !accepted; ++attempt) {
                auto alternate = RotatedPremierWeek(sorted_ids, week, attempt);
                validation::ViolationReport retry_report;
                if (validator_.ValidateWeek(alternate, state.last_week_opponents, week, &retry_report)) {
                    std::ostringstream message;
                    message << "[pairing] Week " << (week + 1) << " accepted after rotation " << attempt;
                    util::EmitLog(log_fn_, message.str());
                    candidate = std::move(alternate);
                    accepted = true;
                    out.retried_weeks += 1;
                }
            }
            if (!accepted) {
                std::ostringstream message;
                message << "[pairing] Week " << (week + 1) << " still invalid after " << kMaxRetryAttempts
                        << " rotations; keeping table week";
                util::EmitLog(log_fn_, message.str());
                out.report.Merge(first_attempt);
            }
        }
        state.Record(candidate);
        out.weeks.push_back(std::move(candidate));
    }
}

void PairingGenerator::GenerateClassic(const std::vector<int>& sorted_ids,
                                       int weeks_count,
                                       SeasonPairings& out) const {
    // Four teams cannot avoid immediate rematches; only C2 is checked weekly.
    const validation::OpponentMap no_prior_week;
    for (int week = 0; week < weeks_count; ++week) {
        auto pairings = BuildClassicWeek(sorted_ids, week);
        if (!validator_.ValidateWeek(pairings, no_prior_week, week, &out.report)) {
            std::ostringstream message;
            message << "[pairing] Week " << (week + 1) << " of the 4-team rotation failed validation";
            util::EmitLog(log_fn_, message.str());
        }
        out.weeks.push_back(std::move(pairings));
    }
}

}  // namespace leaguesched::core::tournament
