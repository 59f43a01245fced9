#include "leaguesched/core/lifecycle/JsonTemplateStore.h"

#include "leaguesched/core/util/AtomicFileWriter.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <utility>

namespace leaguesched::core::lifecycle {

namespace {

constexpr int kStoreVersion = 1;

nlohmann::json RowToJson(const league::ScheduleTemplateRow& row) {
    return {
        {"id", row.id},
        {"division_id", row.division_id},
        {"week_number", row.week_number},
        {"home_team_id", row.home_team_id},
        {"away_team_id", row.away_team_id},
        {"scheduled_date", row.scheduled_date.ToString()},
        {"scheduled_time", row.scheduled_time.ToString()},
        {"field_name", row.field_name},
        {"match_order", row.match_order},
        {"week_type", league::ToString(row.week_type)},
        {"is_special_week", row.is_special_week},
        {"is_practice", row.is_practice},
        {"is_playoff", row.is_playoff},
        {"playoff_round", row.playoff_round},
        {"placeholder_team_id", row.placeholder_team_id},
        {"is_committed", row.is_committed},
    };
}

bool RowFromJson(const nlohmann::json& node, league::ScheduleTemplateRow& row, std::string* error) {
    row = league::ScheduleTemplateRow{};
    row.id = node.value("id", 0);
    row.division_id = node.value("division_id", 0);
    row.week_number = node.value("week_number", 0);
    row.home_team_id = node.value("home_team_id", 0);
    row.away_team_id = node.value("away_team_id", 0);
    const auto date = util::CalendarDate::Parse(node.value("scheduled_date", std::string{}));
    const auto time = util::ClockTime::Parse(node.value("scheduled_time", std::string{}));
    if (!date || !time) {
        if (error) {
            *error = "Template " + std::to_string(row.id) + " has an invalid date or time";
        }
        return false;
    }
    row.scheduled_date = *date;
    row.scheduled_time = *time;
    row.field_name = node.value("field_name", std::string{});
    row.match_order = node.value("match_order", 1);
    row.week_type = league::ParseWeekType(node.value("week_type", std::string{"REGULAR"}));
    row.is_special_week = node.value("is_special_week", false);
    row.is_practice = node.value("is_practice", false);
    row.is_playoff = node.value("is_playoff", false);
    row.playoff_round = node.value("playoff_round", 0);
    row.placeholder_team_id = node.value("placeholder_team_id", 0);
    row.is_committed = node.value("is_committed", false);
    return true;
}

}  // namespace

JsonTemplateStore::JsonTemplateStore(std::string path) : path_(std::move(path)) {}

bool JsonTemplateStore::Load(std::string* error) {
    rows_.clear();
    next_id_ = 1;
    if (!std::filesystem::exists(path_)) {
        return true;
    }

    std::ifstream input(path_);
    if (!input) {
        if (error) {
            *error = "Failed to open template store: " + path_;
        }
        return false;
    }

    nlohmann::json root;
    try {
        input >> root;
    } catch (const std::exception& ex) {
        if (error) {
            *error = std::string("Failed to parse template store: ") + ex.what();
        }
        return false;
    }

    if (!root.is_object()) {
        if (error) {
            *error = "Failed to parse template store: root must be an object";
        }
        return false;
    }

    std::vector<league::ScheduleTemplateRow> loaded;
    int next_id = 1;
    try {
        if (root.contains("templates") && root["templates"].is_array()) {
            for (const auto& node : root["templates"]) {
                if (!node.is_object()) {
                    if (error) {
                        *error = "Failed to parse template store: template entries must be objects";
                    }
                    return false;
                }
                league::ScheduleTemplateRow row;
                if (!RowFromJson(node, row, error)) {
                    return false;
                }
                loaded.push_back(std::move(row));
            }
        }
        next_id = root.value("next_id", 1);
    } catch (const nlohmann::json::exception& ex) {
        if (error) {
            *error = std::string("Failed to parse template store: ") + ex.what();
        }
        return false;
    }
    for (const auto& row : loaded) {
        next_id = std::max(next_id, row.id + 1);
    }
    rows_ = std::move(loaded);
    next_id_ = next_id;
    return true;
}

bool JsonTemplateStore::Save(std::string* error) const {
    nlohmann::json root;
    root["version"] = kStoreVersion;
    root["next_id"] = next_id_;
    root["templates"] = nlohmann::json::array();
    for (const auto& row : rows_) {
        root["templates"].push_back(RowToJson(row));
    }
    return util::AtomicFileWriter::Write(path_, root.dump(2), error);
}

template <typename Mutation>
bool JsonTemplateStore::Apply(Mutation mutation, std::string* error) {
    auto saved_rows = rows_;
    const int saved_next_id = next_id_;
    if (!mutation()) {
        rows_ = std::move(saved_rows);
        next_id_ = saved_next_id;
        return false;
    }
    if (!Save(error)) {
        rows_ = std::move(saved_rows);
        next_id_ = saved_next_id;
        return false;
    }
    return true;
}

bool JsonTemplateStore::InsertRows(std::vector<league::ScheduleTemplateRow>& rows, std::string* error) {
    auto staged = rows;
    const bool ok = Apply([&] { return InMemoryTemplateStore::InsertRows(staged, error); }, error);
    if (ok) {
        rows = std::move(staged);
    }
    return ok;
}

bool JsonTemplateStore::UpdateRows(const std::vector<league::ScheduleTemplateRow>& rows, std::string* error) {
    return Apply([&] { return InMemoryTemplateStore::UpdateRows(rows, error); }, error);
}

bool JsonTemplateStore::RemoveRows(const std::vector<int>& template_ids, std::string* error) {
    return Apply([&] { return InMemoryTemplateStore::RemoveRows(template_ids, error); }, error);
}

}  // namespace leaguesched::core::lifecycle
