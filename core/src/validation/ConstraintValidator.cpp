#include "leaguesched/core/validation/ConstraintValidator.h"

#include <algorithm>
#include <cstdlib>
#include <sstream>

namespace leaguesched::core::validation {

namespace {

constexpr size_t kPremierTeams = 8;
constexpr size_t kPremierWeeks = 7;
constexpr size_t kClassicTeams = 4;
constexpr size_t kClassicCycle = 3;

std::pair<int, int> PairKey(int a, int b) {
    return {std::min(a, b), std::max(a, b)};
}

std::vector<int> TeamsIn(const std::vector<league::WeekPairings>& weeks) {
    std::set<int> teams;
    for (const auto& week : weeks) {
        for (const auto& match : week) {
            if (match.is_placeholder()) {
                continue;
            }
            teams.insert(match.home_team_id);
            teams.insert(match.away_team_id);
        }
    }
    return {teams.begin(), teams.end()};
}

int SlotIndexOf(const util::ClockTime& time, const std::vector<util::ClockTime>& time_slots) {
    const auto it = std::find(time_slots.begin(), time_slots.end(), time);
    if (it == time_slots.end()) {
        return -1;
    }
    return static_cast<int>(it - time_slots.begin());
}

}  // namespace

OpponentMap OpponentsOf(const league::WeekPairings& week) {
    OpponentMap opponents;
    for (const auto& match : week) {
        if (match.is_placeholder()) {
            continue;
        }
        opponents[match.home_team_id].insert(match.away_team_id);
        opponents[match.away_team_id].insert(match.home_team_id);
    }
    return opponents;
}

ConstraintValidator::ConstraintValidator(util::LogFn log_fn) : log_fn_(std::move(log_fn)) {}

void ConstraintValidator::Record(ViolationReport& report,
                                 Constraint constraint,
                                 Severity severity,
                                 int week_index,
                                 const std::string& message) const {
    util::EmitLog(log_fn_, "[validator] " + ToString(constraint) + " " + ToString(severity) + ": " + message);
    report.Add(constraint, severity, week_index, message);
}

bool ConstraintValidator::ValidateWeek(const league::WeekPairings& matches,
                                       const OpponentMap& prior_week_opponents,
                                       int week_index,
                                       ViolationReport* report) const {
    ViolationReport local;
    std::map<int, int> games;
    for (const auto& match : matches) {
        if (match.is_placeholder()) {
            continue;
        }
        games[match.home_team_id] += 1;
        games[match.away_team_id] += 1;
    }

    for (const auto& [team, count] : games) {
        if (count != 2) {
            std::ostringstream message;
            message << "week " << (week_index + 1) << ": team " << team << " plays " << count
                    << " matches (expected 2)";
            Record(local, Constraint::kC2GamesPerWeek, Severity::kHard, week_index, message.str());
        }
    }

    const auto opponents = OpponentsOf(matches);
    for (const auto& [team, current] : opponents) {
        const auto prior = prior_week_opponents.find(team);
        if (prior == prior_week_opponents.end()) {
            continue;
        }
        for (int opponent : current) {
            // Each rematch is reported once, from the lower id.
            if (prior->second.count(opponent) > 0 && team < opponent) {
                std::ostringstream message;
                message << "week " << (week_index + 1) << ": teams " << team << " and " << opponent
                        << " also met the previous week";
                Record(local, Constraint::kC3Rematch, Severity::kHard, week_index, message.str());
            }
        }
    }

    const bool ok = local.empty();
    if (report) {
        report->Merge(local);
    }
    return ok;
}

void ConstraintValidator::CheckPairCounts(const std::vector<league::WeekPairings>& weeks,
                                          size_t first_week,
                                          size_t week_count,
                                          const std::vector<int>& teams,
                                          ViolationReport& report) const {
    std::map<std::pair<int, int>, int> pair_counts;
    for (size_t w = first_week; w < first_week + week_count; ++w) {
        for (const auto& match : weeks[w]) {
            if (!match.is_placeholder()) {
                pair_counts[PairKey(match.home_team_id, match.away_team_id)] += 1;
            }
        }
    }

    for (size_t i = 0; i < teams.size(); ++i) {
        for (size_t j = i + 1; j < teams.size(); ++j) {
            const auto it = pair_counts.find(PairKey(teams[i], teams[j]));
            const int count = it == pair_counts.end() ? 0 : it->second;
            if (count != 2) {
                std::ostringstream message;
                message << "teams " << teams[i] << " and " << teams[j] << " meet " << count
                        << " times in weeks " << (first_week + 1) << "-" << (first_week + week_count)
                        << " (expected 2)";
                Record(report, Constraint::kC1PairCount, Severity::kHard, -1, message.str());
            }
        }
    }
}

void ConstraintValidator::CheckHomeAway(const std::vector<league::WeekPairings>& weeks,
                                        size_t week_count,
                                        const std::vector<int>& teams,
                                        ViolationReport& report) const {
    std::map<int, int> home;
    std::map<int, int> away;
    for (size_t w = 0; w < week_count; ++w) {
        for (const auto& match : weeks[w]) {
            if (match.is_placeholder()) {
                continue;
            }
            home[match.home_team_id] += 1;
            away[match.away_team_id] += 1;
        }
    }
    for (int team : teams) {
        if (home[team] != away[team]) {
            std::ostringstream message;
            message << "team " << team << " has " << home[team] << " home and " << away[team]
                    << " away matches over " << week_count << " weeks";
            Record(report, Constraint::kC4HomeAway, Severity::kHard, -1, message.str());
        }
    }
}

ViolationReport ConstraintValidator::ValidateFinalSchedule(const std::vector<league::WeekPairings>& weeks) const {
    ViolationReport report;
    const auto teams = TeamsIn(weeks);

    if (teams.size() == kPremierTeams) {
        if (weeks.size() != kPremierWeeks) {
            std::ostringstream message;
            message << "season has " << weeks.size() << " weeks; pair and home/away totals need "
                    << kPremierWeeks;
            Record(report, Constraint::kPartialCycle, Severity::kAdvisory, -1, message.str());
            return report;
        }
        CheckPairCounts(weeks, 0, weeks.size(), teams, report);
        CheckHomeAway(weeks, weeks.size(), teams, report);
        return report;
    }

    if (teams.size() == kClassicTeams) {
        const size_t full_blocks = weeks.size() / kClassicCycle;
        for (size_t block = 0; block < full_blocks; ++block) {
            CheckPairCounts(weeks, block * kClassicCycle, kClassicCycle, teams, report);
        }
        if (full_blocks > 0) {
            CheckHomeAway(weeks, full_blocks * kClassicCycle, teams, report);
        }
        if (weeks.size() % kClassicCycle != 0) {
            std::ostringstream message;
            message << "season of " << weeks.size() << " weeks ends with a partial rotation of "
                    << (weeks.size() % kClassicCycle) << " week(s); pair balance not restored";
            Record(report, Constraint::kPartialCycle, Severity::kAdvisory, -1, message.str());
        }
    }

    return report;
}

ViolationReport ConstraintValidator::ValidateAssignments(const std::vector<league::WeekAssignments>& weeks,
                                                         const std::vector<util::ClockTime>& time_slots) const {
    ViolationReport report;
    std::map<int, std::map<std::string, int>> field_counts;
    std::map<int, int> early_weeks;
    std::map<int, int> late_weeks;
    const bool has_windows = time_slots.size() >= 4;

    for (size_t w = 0; w < weeks.size(); ++w) {
        std::map<int, std::vector<int>> team_slots;
        for (const auto& assignment : weeks[w]) {
            if (assignment.home_team_id == assignment.away_team_id) {
                continue;
            }
            const int slot = SlotIndexOf(assignment.time, time_slots);
            team_slots[assignment.home_team_id].push_back(slot);
            team_slots[assignment.away_team_id].push_back(slot);
            field_counts[assignment.home_team_id][assignment.field] += 1;
            field_counts[assignment.away_team_id][assignment.field] += 1;
        }

        for (auto& [team, slots] : team_slots) {
            if (slots.size() != 2) {
                continue;
            }
            std::sort(slots.begin(), slots.end());
            const bool back_to_back = slots[0] >= 0 && slots[1] == slots[0] + 1;
            const bool same_window = back_to_back && (slots[0] / 2 == slots[1] / 2);
            if (!same_window) {
                std::ostringstream message;
                message << "week " << (w + 1) << ": team " << team << " plays in slots " << slots[0] << " and "
                        << slots[1] << ", not back-to-back in one window";
                Record(report, Constraint::kC2GamesPerWeek, Severity::kHard, static_cast<int>(w), message.str());
                continue;
            }
            if (has_windows) {
                if (slots[0] / 2 == 0) {
                    early_weeks[team] += 1;
                } else {
                    late_weeks[team] += 1;
                }
            }
        }
    }

    for (const auto& [team, per_field] : field_counts) {
        int total = 0;
        int lowest = -1;
        int highest = 0;
        for (const auto& [field, count] : per_field) {
            total += count;
            highest = std::max(highest, count);
            lowest = lowest < 0 ? count : std::min(lowest, count);
        }
        // A field never used counts as zero.
        if (per_field.size() < 2) {
            lowest = 0;
        }
        if (highest - lowest > total % 2) {
            std::ostringstream message;
            message << "team " << team << " field split";
            for (const auto& [field, count] : per_field) {
                message << ' ' << field << '=' << count;
            }
            Record(report, Constraint::kC5FieldBalance, Severity::kAdvisory, -1, message.str());
        }
    }

    if (has_windows) {
        std::set<int> teams;
        for (const auto& [team, count] : early_weeks) {
            teams.insert(team);
        }
        for (const auto& [team, count] : late_weeks) {
            teams.insert(team);
        }
        for (int team : teams) {
            const int early = early_weeks[team];
            const int late = late_weeks[team];
            if (std::abs(early - late) > 1) {
                std::ostringstream message;
                message << "team " << team << " plays " << early << " early and " << late << " late weeks";
                Record(report, Constraint::kC6WindowBalance, Severity::kAdvisory, -1, message.str());
            }
        }
    }

    return report;
}

}  // namespace leaguesched::core::validation
