#pragma once

#include "leaguesched/core/util/CalendarDate.h"

#include <optional>
#include <string>
#include <vector>

namespace leaguesched::core::league {

struct Team {
    int id = 0;
    std::string name;
    int division_id = 0;

    bool is_placeholder() const { return id < 0; }
};

enum class DivisionType {
    kPremier,
    kClassic,
    kEcsFc,
    kOther,
};

enum class WeekType {
    kRegular,
    kPlayoff,
    kMixed,
    kPractice,
    kFun,
    kTst,
    kBye,
    kBonus,
    kUnknown,
};

std::string ToString(DivisionType type);
std::string ToString(WeekType type);
DivisionType ParseDivisionType(const std::string& text);
WeekType ParseWeekType(const std::string& text);

struct WeekDescriptor {
    std::optional<util::CalendarDate> date;
    WeekType week_type = WeekType::kRegular;
    // Raw tag as supplied; kept for logging when week_type is kUnknown.
    std::string week_type_tag;
    int week_order = 0;
    std::optional<int> playoff_round;
    bool is_practice_session = false;
    std::string description;
};

struct MatchSlot {
    int home_team_id = 0;
    int away_team_id = 0;

    bool is_placeholder() const { return home_team_id == away_team_id; }
    bool operator==(const MatchSlot& other) const {
        return home_team_id == other.home_team_id && away_team_id == other.away_team_id;
    }
};

using WeekPairings = std::vector<MatchSlot>;

struct SlotAssignment {
    int home_team_id = 0;
    int away_team_id = 0;
    util::ClockTime time;
    std::string field;
    int match_order = 1;
};

using WeekAssignments = std::vector<SlotAssignment>;

struct ScheduleTemplateRow {
    int id = 0;
    int division_id = 0;
    int week_number = 0;
    int home_team_id = 0;
    int away_team_id = 0;
    util::CalendarDate scheduled_date;
    util::ClockTime scheduled_time;
    std::string field_name;
    int match_order = 1;
    WeekType week_type = WeekType::kRegular;
    bool is_special_week = false;
    bool is_practice = false;
    bool is_playoff = false;
    int playoff_round = 0;
    int placeholder_team_id = 0;
    bool is_committed = false;
};

}  // namespace leaguesched::core::league
