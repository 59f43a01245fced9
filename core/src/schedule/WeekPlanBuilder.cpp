#include "leaguesched/core/schedule/WeekPlanBuilder.h"

#include <algorithm>
#include <sstream>
#include <utility>

namespace leaguesched::core::schedule {

namespace {

constexpr size_t kPracticeMatches = 2;

std::string WeekLabel(const league::WeekDescriptor& week) {
    std::ostringstream out;
    out << "week " << week.week_order;
    if (week.date) {
        out << " (" << week.date->ToString() << ")";
    }
    return out.str();
}

}  // namespace

WeekPlanBuilder::WeekPlanBuilder(const roster::RosterResolver& roster,
                                 WeekPlanSettings settings,
                                 util::LogFn log_fn)
    : roster_(roster), settings_(std::move(settings)), log_fn_(std::move(log_fn)) {
    if (settings_.fields.empty()) {
        settings_.fields = DefaultFields();
    }
}

void WeekPlanBuilder::Log(const std::string& line) const {
    util::EmitLog(log_fn_, "[weekplan] " + line);
}

bool WeekPlanBuilder::RequireDate(const league::WeekDescriptor& week, league::ScheduleError* error) const {
    if (week.date) {
        return true;
    }
    return league::SetError(error, league::ScheduleErrorCode::kMissingWeekDate,
                            "Week " + std::to_string(week.week_order) + " (" +
                                league::ToString(week.week_type) + ") has no date");
}

std::vector<util::ClockTime> WeekPlanBuilder::TimeSlotsFor(size_t match_count) const {
    return SlotAssigner::DivisionTimeSlots(settings_.division_type, match_count, settings_.start_time,
                                           settings_.match_minutes);
}

const league::WeekPairings* WeekPlanBuilder::NextPairing(const league::WeekDescriptor& week,
                                                         const std::vector<league::WeekPairings>& pairings,
                                                         WeekPlanResult& out) const {
    if (out.pairings_used >= static_cast<int>(pairings.size())) {
        Log("No pairings left for " + WeekLabel(week) + "; week skipped");
        out.skipped_weeks += 1;
        return nullptr;
    }
    return &pairings[static_cast<size_t>(out.pairings_used++)];
}

league::ScheduleTemplateRow WeekPlanBuilder::MakeRow(const league::WeekDescriptor& week,
                                                     league::WeekType row_type) const {
    league::ScheduleTemplateRow row;
    row.division_id = settings_.division_id;
    row.week_number = week.week_order;
    row.scheduled_date = week.date.value_or(util::CalendarDate{});
    row.week_type = row_type;
    return row;
}

bool WeekPlanBuilder::Build(const std::vector<league::WeekDescriptor>& weeks,
                            const std::vector<league::WeekPairings>& pairings,
                            WeekPlanResult& out,
                            league::ScheduleError* error) const {
    out = WeekPlanResult{};
    out.history.season_weeks = static_cast<int>(pairings.size());
    const bool premier = settings_.division_type == league::DivisionType::kPremier;
    const bool classic = settings_.division_type == league::DivisionType::kClassic;

    for (const auto& week : weeks) {
        auto week_type = week.week_type;
        if (week_type == league::WeekType::kMixed) {
            if (premier) {
                week_type = league::WeekType::kPlayoff;
            } else if (classic) {
                week_type = league::WeekType::kRegular;
            } else {
                Log("MIXED " + WeekLabel(week) + " is only defined for Premier and Classic; no rows");
                out.skipped_weeks += 1;
                continue;
            }
        }

        switch (week_type) {
            case league::WeekType::kRegular: {
                if (!RequireDate(week, error)) {
                    out = WeekPlanResult{};
                    return false;
                }
                const auto* pairing = NextPairing(week, pairings, out);
                if (!pairing) {
                    break;
                }
                if (week.is_practice_session && classic) {
                    EmitPracticeWeek(week, *pairing, league::WeekType::kRegular, out);
                } else {
                    if (week.is_practice_session) {
                        Log("Practice flag on " + WeekLabel(week) + " ignored outside Classic");
                    }
                    EmitRegularWeek(week, *pairing, out);
                }
                break;
            }
            case league::WeekType::kPractice: {
                if (!RequireDate(week, error)) {
                    out = WeekPlanResult{};
                    return false;
                }
                const auto* pairing = NextPairing(week, pairings, out);
                if (pairing) {
                    EmitPracticeWeek(week, *pairing, league::WeekType::kPractice, out);
                }
                break;
            }
            case league::WeekType::kPlayoff:
            case league::WeekType::kFun:
            case league::WeekType::kTst:
            case league::WeekType::kBye:
            case league::WeekType::kBonus:
                if (!RequireDate(week, error)) {
                    out = WeekPlanResult{};
                    return false;
                }
                EmitPlaceholderWeek(week, week_type, out);
                break;
            case league::WeekType::kMixed:
            case league::WeekType::kUnknown:
                Log("Unknown week type '" + week.week_type_tag + "' for " + WeekLabel(week) + "; skipped");
                out.skipped_weeks += 1;
                break;
        }
    }
    return true;
}

void WeekPlanBuilder::EmitRegularWeek(const league::WeekDescriptor& week,
                                      const league::WeekPairings& pairing,
                                      WeekPlanResult& out) const {
    const auto time_slots = TimeSlotsFor(pairing.size());
    auto assignments = SlotAssigner::Assign(pairing, time_slots, settings_.fields);
    if (settings_.division_type == league::DivisionType::kPremier) {
        if (SlotAssigner::BalancePremierTimeSlots(assignments, time_slots, out.history)) {
            Log("Swapped early and late windows for " + WeekLabel(week));
        }
    } else {
        out.history.Record(assignments, time_slots);
    }

    for (const auto& assignment : assignments) {
        auto row = MakeRow(week, league::WeekType::kRegular);
        row.home_team_id = assignment.home_team_id;
        row.away_team_id = assignment.away_team_id;
        row.scheduled_time = assignment.time;
        row.field_name = assignment.field;
        row.match_order = assignment.match_order;
        out.rows.push_back(std::move(row));
    }
    out.regular_time_slots = time_slots;
    out.regular_weeks.push_back(std::move(assignments));
}

void WeekPlanBuilder::EmitPracticeWeek(const league::WeekDescriptor& week,
                                       const league::WeekPairings& pairing,
                                       league::WeekType practice_tag,
                                       WeekPlanResult& out) const {
    const auto time_slots = TimeSlotsFor(pairing.size());
    const auto& practice_time = time_slots.front();
    const auto& game_time = time_slots.size() > 1 ? time_slots[1] : time_slots.front();

    // The first matches of a week are disjoint, so each team plays once.
    const size_t real_count = std::min(pairing.size(), kPracticeMatches);
    for (size_t i = 0; i < real_count; ++i) {
        const auto& field = settings_.fields[i % settings_.fields.size()];
        auto practice = MakeRow(week, practice_tag);
        practice.home_team_id = pairing[i].home_team_id;
        practice.away_team_id = pairing[i].home_team_id;
        practice.scheduled_time = practice_time;
        practice.field_name = field;
        practice.match_order = 1;
        practice.is_practice = true;
        practice.is_special_week = true;
        out.rows.push_back(std::move(practice));
    }
    for (size_t i = 0; i < real_count; ++i) {
        auto row = MakeRow(week, league::WeekType::kRegular);
        row.home_team_id = pairing[i].home_team_id;
        row.away_team_id = pairing[i].away_team_id;
        row.scheduled_time = game_time;
        row.field_name = settings_.fields[i % settings_.fields.size()];
        row.match_order = 2;
        out.rows.push_back(std::move(row));
    }
}

void WeekPlanBuilder::EmitPlaceholderWeek(const league::WeekDescriptor& week,
                                          league::WeekType row_type,
                                          WeekPlanResult& out) const {
    const auto& teams = roster_.real_teams();
    const auto time_slots = TimeSlotsFor(teams.size());
    const auto placeholder = roster_.PlaceholderFor(row_type);
    const bool playoff = row_type == league::WeekType::kPlayoff;

    for (size_t i = 0; i < teams.size(); ++i) {
        auto row = MakeRow(week, row_type);
        row.home_team_id = teams[i].id;
        row.away_team_id = teams[i].id;
        row.scheduled_time = time_slots[i % time_slots.size()];
        row.field_name = settings_.fields[i % settings_.fields.size()];
        row.is_special_week = true;
        row.is_playoff = playoff;
        row.playoff_round = playoff ? week.playoff_round.value_or(1) : 0;
        row.placeholder_team_id = placeholder ? placeholder->id : 0;
        out.rows.push_back(std::move(row));
    }
}

}  // namespace leaguesched::core::schedule
