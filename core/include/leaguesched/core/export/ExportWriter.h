#pragma once

#include "leaguesched/core/league/LeagueTypes.h"
#include "leaguesched/core/lifecycle/TemplateLifecycle.h"
#include "leaguesched/core/roster/RosterResolver.h"
#include "leaguesched/core/validation/ViolationReport.h"

#include <string>
#include <vector>

namespace leaguesched::core::exporter {

bool WritePreviewJson(const std::string& path, const lifecycle::SchedulePreview& preview);
// Rows are written sorted by week, time and field.
bool WriteScheduleCsv(const std::string& path,
                      const std::vector<league::ScheduleTemplateRow>& rows,
                      const roster::RosterResolver& roster);
bool WriteViolationReportJson(const std::string& path, const validation::ViolationReport& report);

}  // namespace leaguesched::core::exporter
