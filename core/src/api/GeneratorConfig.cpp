#include "leaguesched/core/api/GeneratorConfig.h"

#include "leaguesched/core/league/LeagueTypes.h"
#include "leaguesched/core/util/AtomicFileWriter.h"

#include <nlohmann/json.hpp>

#include <fstream>

namespace leaguesched::core::api {

namespace {

bool LoadJson(const std::string& path, nlohmann::json& config, std::string* error) {
    std::ifstream input(path);
    if (!input) {
        if (error) {
            *error = "Failed to open config: " + path;
        }
        return false;
    }
    try {
        input >> config;
    } catch (const std::exception& ex) {
        if (error) {
            *error = std::string("Failed to parse JSON: ") + ex.what();
        }
        return false;
    }
    return true;
}

bool ParseTeam(const nlohmann::json& node, TeamConfig& out) {
    if (!node.is_object() || !node.contains("id") || !node.at("id").is_number_integer()) {
        return false;
    }
    out.id = node.at("id").get<int>();
    out.name = node.value("name", std::string{});
    return true;
}

bool ParseWeek(const nlohmann::json& node, WeekConfig& out) {
    if (!node.is_object()) {
        return false;
    }
    out.date = node.value("date", out.date);
    out.week_type = node.value("week_type", out.week_type);
    if (node.contains("playoff_round") && node.at("playoff_round").is_number_integer()) {
        out.playoff_round = node.at("playoff_round").get<int>();
    }
    out.is_practice_session = node.value("is_practice_session", out.is_practice_session);
    out.description = node.value("description", out.description);
    return true;
}

bool ParseConfig(const nlohmann::json& root, GeneratorConfig& config, std::string* error) {
    config = GeneratorConfig{};
    if (!root.is_object()) {
        if (error) {
            *error = "Config root must be an object.";
        }
        return false;
    }

    try {
        if (root.contains("division")) {
            const auto& node = root.at("division");
            config.division.id = node.value("id", config.division.id);
            config.division.name = node.value("name", config.division.name);
            config.division.type = node.value("type", config.division.type);
        }

        if (root.contains("teams")) {
            for (const auto& team_node : root.at("teams")) {
                TeamConfig team;
                if (!ParseTeam(team_node, team)) {
                    if (error) {
                        *error = "Failed to parse team entries.";
                    }
                    return false;
                }
                config.teams.push_back(std::move(team));
            }
        }

        auto& layout = config.season.layout;
        layout = season::SeasonConfiguration::DefaultsFor(league::ParseDivisionType(config.division.type));
        if (root.contains("season")) {
            const auto& node = root.at("season");
            config.season.start_date = node.value("start_date", config.season.start_date);
            config.season.days_between_weeks = node.value("days_between_weeks", config.season.days_between_weeks);
            layout.regular_season_weeks = node.value("regular_season_weeks", layout.regular_season_weeks);
            layout.playoff_weeks = node.value("playoff_weeks", layout.playoff_weeks);
            layout.has_fun_week = node.value("has_fun_week", layout.has_fun_week);
            layout.has_tst_week = node.value("has_tst_week", layout.has_tst_week);
            layout.has_bonus_week = node.value("has_bonus_week", layout.has_bonus_week);
            layout.has_practice_sessions = node.value("has_practice_sessions", layout.has_practice_sessions);
            if (node.contains("practice_weeks")) {
                layout.practice_weeks = node.at("practice_weeks").get<std::vector<int>>();
            }
        }

        if (root.contains("weeks")) {
            for (const auto& week_node : root.at("weeks")) {
                WeekConfig week;
                if (!ParseWeek(week_node, week)) {
                    if (error) {
                        *error = "Failed to parse week entries.";
                    }
                    return false;
                }
                config.weeks.push_back(std::move(week));
            }
        }

        if (root.contains("schedule")) {
            const auto& node = root.at("schedule");
            if (node.contains("fields")) {
                config.schedule.fields = node.at("fields").get<std::vector<std::string>>();
            }
            config.schedule.start_time = node.value("start_time", config.schedule.start_time);
            config.schedule.match_duration_minutes =
                node.value("match_duration_minutes", config.schedule.match_duration_minutes);
        }

        if (root.contains("output")) {
            const auto& output = root.at("output");
            config.output.preview_json = output.value("preview_json", config.output.preview_json);
            config.output.schedule_csv = output.value("schedule_csv", config.output.schedule_csv);
            config.output.violations_json = output.value("violations_json", config.output.violations_json);
            config.output.template_store_json =
                output.value("template_store_json", config.output.template_store_json);
        }
    } catch (const nlohmann::json::exception& ex) {
        if (error) {
            *error = std::string("Invalid config value: ") + ex.what();
        }
        return false;
    }
    return true;
}

nlohmann::json ToJson(const GeneratorConfig& config) {
    nlohmann::json root;
    root["division"] = {
        {"id", config.division.id},
        {"name", config.division.name},
        {"type", config.division.type},
    };

    root["teams"] = nlohmann::json::array();
    for (const auto& team : config.teams) {
        root["teams"].push_back({{"id", team.id}, {"name", team.name}});
    }

    const auto& layout = config.season.layout;
    root["season"] = {
        {"start_date", config.season.start_date},
        {"days_between_weeks", config.season.days_between_weeks},
        {"regular_season_weeks", layout.regular_season_weeks},
        {"playoff_weeks", layout.playoff_weeks},
        {"has_fun_week", layout.has_fun_week},
        {"has_tst_week", layout.has_tst_week},
        {"has_bonus_week", layout.has_bonus_week},
        {"has_practice_sessions", layout.has_practice_sessions},
        {"practice_weeks", layout.practice_weeks},
    };

    if (!config.weeks.empty()) {
        root["weeks"] = nlohmann::json::array();
        for (const auto& week : config.weeks) {
            nlohmann::json node = {
                {"date", week.date},
                {"week_type", week.week_type},
                {"is_practice_session", week.is_practice_session},
                {"description", week.description},
            };
            if (week.playoff_round) {
                node["playoff_round"] = *week.playoff_round;
            }
            root["weeks"].push_back(std::move(node));
        }
    }

    root["schedule"] = {
        {"fields", config.schedule.fields},
        {"start_time", config.schedule.start_time},
        {"match_duration_minutes", config.schedule.match_duration_minutes},
    };

    root["output"] = {
        {"preview_json", config.output.preview_json},
        {"schedule_csv", config.output.schedule_csv},
        {"violations_json", config.output.violations_json},
        {"template_store_json", config.output.template_store_json},
    };
    return root;
}

}  // namespace

bool GeneratorConfig::LoadFromFile(const std::string& path, GeneratorConfig& config, std::string* error) {
    nlohmann::json root;
    if (!LoadJson(path, root, error)) {
        return false;
    }
    return ParseConfig(root, config, error);
}

bool GeneratorConfig::LoadFromString(const std::string& text, GeneratorConfig& config, std::string* error) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(text);
    } catch (const std::exception& ex) {
        if (error) {
            *error = std::string("Failed to parse JSON: ") + ex.what();
        }
        return false;
    }
    return ParseConfig(root, config, error);
}

bool GeneratorConfig::SaveToFile(const std::string& path, const GeneratorConfig& config, std::string* error) {
    if (!util::AtomicFileWriter::Write(path, ToJson(config).dump(2), error)) {
        if (error && error->empty()) {
            *error = "Failed to write config: " + path;
        }
        return false;
    }
    return true;
}

std::string GeneratorConfig::ToJsonString(const GeneratorConfig& config) {
    return ToJson(config).dump(2);
}

}  // namespace leaguesched::core::api
