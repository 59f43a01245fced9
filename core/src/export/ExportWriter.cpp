#include "leaguesched/core/export/ExportWriter.h"

#include "leaguesched/core/util/AtomicFileWriter.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <sstream>

namespace leaguesched::core::exporter {

namespace {

std::string TeamName(const roster::RosterResolver& roster, int team_id) {
    const auto team = roster.FindTeam(team_id);
    return team ? team->name : "Unknown";
}

// Quotes a CSV cell when it carries a separator or a quote.
std::string CsvCell(const std::string& value) {
    if (value.find_first_of(",\"\n") == std::string::npos) {
        return value;
    }
    std::string quoted = "\"";
    for (char ch : value) {
        if (ch == '"') {
            quoted.push_back('"');
        }
        quoted.push_back(ch);
    }
    quoted.push_back('"');
    return quoted;
}

}  // namespace

bool WritePreviewJson(const std::string& path, const lifecycle::SchedulePreview& preview) {
    nlohmann::json root;
    root["weeks"] = nlohmann::json::array();
    for (const auto& [week_number, entries] : preview) {
        nlohmann::json week;
        week["week_number"] = week_number;
        week["matches"] = nlohmann::json::array();
        for (const auto& entry : entries) {
            week["matches"].push_back({
                {"template_id", entry.template_id},
                {"date", entry.date.ToString()},
                {"time", entry.time.ToString()},
                {"field", entry.field},
                {"home_team_id", entry.home_team_id},
                {"away_team_id", entry.away_team_id},
                {"home_team", entry.home_team_name},
                {"away_team", entry.away_team_name},
                {"week_type", league::ToString(entry.week_type)},
                {"is_special", entry.is_special},
                {"is_practice", entry.is_practice},
                {"is_playoff", entry.is_playoff},
                {"playoff_round", entry.playoff_round},
            });
        }
        root["weeks"].push_back(std::move(week));
    }
    return util::AtomicFileWriter::Write(path, root.dump(2));
}

bool WriteScheduleCsv(const std::string& path,
                      const std::vector<league::ScheduleTemplateRow>& rows,
                      const roster::RosterResolver& roster) {
    auto sorted = rows;
    std::stable_sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) {
        if (a.week_number != b.week_number) {
            return a.week_number < b.week_number;
        }
        if (a.scheduled_time != b.scheduled_time) {
            return a.scheduled_time < b.scheduled_time;
        }
        return a.field_name < b.field_name;
    });

    std::ostringstream csv;
    csv << "week,date,time,field,home,away,week_type,special,practice,playoff_round\n";
    for (const auto& row : sorted) {
        csv << row.week_number << ','
            << row.scheduled_date.ToString() << ','
            << row.scheduled_time.ToString() << ','
            << CsvCell(row.field_name) << ','
            << CsvCell(TeamName(roster, row.home_team_id)) << ','
            << CsvCell(TeamName(roster, row.away_team_id)) << ','
            << league::ToString(row.week_type) << ','
            << (row.is_special_week ? 1 : 0) << ','
            << (row.is_practice ? 1 : 0) << ','
            << row.playoff_round
            << "\n";
    }
    return util::AtomicFileWriter::Write(path, csv.str());
}

bool WriteViolationReportJson(const std::string& path, const validation::ViolationReport& report) {
    nlohmann::json root;
    root["hard_count"] = report.hard_count();
    root["advisory_count"] = report.advisory_count();
    root["violations"] = nlohmann::json::array();
    for (const auto& violation : report.violations()) {
        nlohmann::json node = {
            {"constraint", validation::ToString(violation.constraint)},
            {"severity", validation::ToString(violation.severity)},
            {"message", violation.message},
        };
        if (violation.week_index >= 0) {
            node["week"] = violation.week_index + 1;
        } else {
            node["week"] = nullptr;
        }
        root["violations"].push_back(std::move(node));
    }
    return util::AtomicFileWriter::Write(path, root.dump(2));
}

}  // namespace leaguesched::core::exporter
