#pragma once

#include "leaguesched/core/season/SeasonConfiguration.h"

#include <optional>
#include <string>
#include <vector>

namespace leaguesched::core::api {

struct DivisionConfig {
    int id = 1;
    std::string name;
    std::string type = "OTHER";
};

struct TeamConfig {
    int id = 0;
    std::string name;
};

struct SeasonSettings {
    std::string start_date;
    int days_between_weeks = 7;
    // Seeded from the division defaults; keys present in the file override.
    season::SeasonConfiguration layout;
};

// One explicit week. When the weeks list is non-empty it replaces the layout
// generated from the season settings.
struct WeekConfig {
    std::string date;
    std::string week_type = "REGULAR";
    std::optional<int> playoff_round;
    bool is_practice_session = false;
    std::string description;
};

struct ScheduleSettings {
    std::vector<std::string> fields = {"North", "South"};
    std::string start_time = "08:00";
    int match_duration_minutes = 70;
};

struct OutputConfig {
    std::string preview_json = "out/preview.json";
    std::string schedule_csv = "out/schedule.csv";
    std::string violations_json = "out/violations.json";
    std::string template_store_json = "out/templates.json";
};

struct GeneratorConfig {
    DivisionConfig division;
    std::vector<TeamConfig> teams;
    SeasonSettings season;
    std::vector<WeekConfig> weeks;
    ScheduleSettings schedule;
    OutputConfig output;

    static bool LoadFromFile(const std::string& path, GeneratorConfig& config, std::string* error);
    static bool LoadFromString(const std::string& text, GeneratorConfig& config, std::string* error);
    static bool SaveToFile(const std::string& path, const GeneratorConfig& config, std::string* error);
    static std::string ToJsonString(const GeneratorConfig& config);
};

}  // namespace leaguesched::core::api
