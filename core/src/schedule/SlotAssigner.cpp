#include "leaguesched/core/schedule/SlotAssigner.h"

#include <algorithm>
#include <set>

namespace leaguesched::core::schedule {

namespace {

constexpr size_t kMatchesPerSlot = 2;
constexpr size_t kPremierSlots = 4;
constexpr size_t kPremierMatches = 8;

int SlotIndexOf(const util::ClockTime& time, const std::vector<util::ClockTime>& time_slots) {
    const auto it = std::find(time_slots.begin(), time_slots.end(), time);
    return it == time_slots.end() ? -1 : static_cast<int>(it - time_slots.begin());
}

}  // namespace

std::vector<std::string> DefaultFields() {
    return {"North", "South"};
}

void SlotHistory::Record(const league::WeekAssignments& assignments,
                         const std::vector<util::ClockTime>& time_slots) {
    std::set<int> early;
    std::set<int> late;
    for (const auto& assignment : assignments) {
        if (assignment.home_team_id == assignment.away_team_id) {
            continue;
        }
        field_counts[assignment.home_team_id][assignment.field] += 1;
        field_counts[assignment.away_team_id][assignment.field] += 1;
        if (time_slots.size() < kPremierSlots) {
            continue;
        }
        const int slot = SlotIndexOf(assignment.time, time_slots);
        auto& window = slot >= 0 && slot < 2 ? early : late;
        window.insert(assignment.home_team_id);
        window.insert(assignment.away_team_id);
    }
    for (int team : early) {
        early_weeks[team] += 1;
    }
    for (int team : late) {
        late_weeks[team] += 1;
    }
}

std::vector<util::ClockTime> SlotAssigner::DivisionTimeSlots(league::DivisionType type,
                                                             size_t match_count,
                                                             util::ClockTime start_time,
                                                             int match_minutes) {
    switch (type) {
        case league::DivisionType::kPremier:
            return {{8, 20}, {9, 30}, {10, 40}, {11, 50}};
        case league::DivisionType::kClassic:
            return {{13, 10}, {14, 20}};
        default:
            break;
    }
    const size_t slot_count = std::max<size_t>(1, (match_count + kMatchesPerSlot - 1) / kMatchesPerSlot);
    std::vector<util::ClockTime> slots;
    slots.reserve(slot_count);
    util::ClockTime current = start_time;
    for (size_t i = 0; i < slot_count; ++i) {
        slots.push_back(current);
        current = current.AddMinutes(match_minutes);
    }
    return slots;
}

league::WeekAssignments SlotAssigner::Assign(const league::WeekPairings& matches,
                                             const std::vector<util::ClockTime>& time_slots,
                                             const std::vector<std::string>& fields) {
    league::WeekAssignments assignments;
    if (matches.empty() || time_slots.empty()) {
        return assignments;
    }
    const auto field_names = fields.empty() ? DefaultFields() : fields;
    assignments.reserve(matches.size());

    // 4x2 and 8x4 fill every slot with one match per field. Other shapes wrap
    // around the available slots.
    const bool fixed_layout = (matches.size() == 4 && time_slots.size() == 2) ||
                              (matches.size() == kPremierMatches && time_slots.size() == kPremierSlots);

    std::map<int, int> matches_today;
    for (size_t i = 0; i < matches.size(); ++i) {
        const auto& match = matches[i];
        size_t slot = i / kMatchesPerSlot;
        if (!fixed_layout) {
            slot %= time_slots.size();
        }
        league::SlotAssignment assignment;
        assignment.home_team_id = match.home_team_id;
        assignment.away_team_id = match.away_team_id;
        assignment.time = time_slots[slot];
        assignment.field = field_names[i % std::min(field_names.size(), kMatchesPerSlot)];
        assignment.match_order = ++matches_today[match.home_team_id];
        if (match.away_team_id != match.home_team_id) {
            ++matches_today[match.away_team_id];
        }
        assignments.push_back(std::move(assignment));
    }
    return assignments;
}

bool SlotAssigner::BalancePremierTimeSlots(league::WeekAssignments& assignments,
                                           const std::vector<util::ClockTime>& time_slots,
                                           SlotHistory& history) {
    if (assignments.size() != kPremierMatches || time_slots.size() != kPremierSlots) {
        history.Record(assignments, time_slots);
        return false;
    }

    std::set<int> early;
    std::set<int> late;
    for (const auto& assignment : assignments) {
        const int slot = SlotIndexOf(assignment.time, time_slots);
        auto& window = slot >= 0 && slot < 2 ? early : late;
        window.insert(assignment.home_team_id);
        window.insert(assignment.away_team_id);
    }

    const int share = (history.season_weeks + 1) / 2;
    const auto early_count = [&](int team) {
        const auto it = history.early_weeks.find(team);
        return it == history.early_weeks.end() ? 0 : it->second;
    };
    const auto late_count = [&](int team) {
        const auto it = history.late_weeks.find(team);
        return it == history.late_weeks.end() ? 0 : it->second;
    };

    const bool early_over = std::any_of(early.begin(), early.end(), [&](int team) {
        return early_count(team) + 1 > share;
    });
    const bool swap_fits =
        std::all_of(late.begin(), late.end(), [&](int team) { return early_count(team) + 1 <= share; }) &&
        std::all_of(early.begin(), early.end(), [&](int team) { return late_count(team) + 1 <= share; });

    bool swapped = false;
    if (early_over && swap_fits) {
        for (auto& assignment : assignments) {
            const int slot = SlotIndexOf(assignment.time, time_slots);
            if (slot < 0) {
                continue;
            }
            assignment.time = time_slots[static_cast<size_t>((slot + 2) % 4)];
        }
        std::stable_sort(assignments.begin(), assignments.end(), [](const auto& a, const auto& b) {
            return a.time < b.time;
        });
        swapped = true;
    }

    history.Record(assignments, time_slots);
    return swapped;
}

}  // namespace leaguesched::core::schedule
