#pragma once

#include "leaguesched/core/api/GeneratorConfig.h"
#include "leaguesched/core/league/LeagueTypes.h"
#include "leaguesched/core/league/ScheduleError.h"
#include "leaguesched/core/lifecycle/IMatchCreator.h"
#include "leaguesched/core/lifecycle/TemplateLifecycle.h"
#include "leaguesched/core/roster/RosterResolver.h"
#include "leaguesched/core/validation/ViolationReport.h"

#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace leaguesched::core::api {

struct GenerationResult {
    league::DivisionType division_type = league::DivisionType::kOther;
    std::vector<league::WeekDescriptor> weeks;
    std::vector<league::ScheduleTemplateRow> rows;
    validation::ViolationReport report;
    int retried_weeks = 0;
    int skipped_weeks = 0;
};

class ScheduleService {
public:
    ScheduleService() = default;

    // Roster -> pairings -> week plan -> assignment checks. Constraint
    // findings land in result.report; only fatal problems return false.
    bool Generate(const GeneratorConfig& config, GenerationResult& result, league::ScheduleError* error);

    // Preview JSON is written from result.rows; persisted ids are kept when present.
    bool WriteOutputs(const GeneratorConfig& config, const GenerationResult& result, std::string* error);

    // Template store operations against output.template_store_json.
    bool PersistTemplates(const GeneratorConfig& config, GenerationResult& result, league::ScheduleError* error);
    bool CommitTemplates(const GeneratorConfig& config,
                         lifecycle::IMatchCreator& match_creator,
                         league::ScheduleError* error);
    bool DeleteTemplates(const GeneratorConfig& config, league::ScheduleError* error);
    bool PreviewTemplates(const GeneratorConfig& config,
                          lifecycle::SchedulePreview& preview,
                          league::ScheduleError* error);

    static roster::RosterResolver BuildRoster(const GeneratorConfig& config);
    static bool BuildWeekDescriptors(const GeneratorConfig& config,
                                     std::vector<league::WeekDescriptor>& weeks,
                                     league::ScheduleError* error);

    std::string getLastLogLines(int n) const;
    util::LogFn logger();

private:
    template <typename Operation>
    bool WithTemplateStore(const GeneratorConfig& config,
                           lifecycle::IMatchCreator* match_creator,
                           league::ScheduleError* error,
                           Operation operation);
    void AppendLogLine(const std::string& line);

    mutable std::mutex log_mutex_;
    std::deque<std::string> log_lines_{};
    size_t max_log_lines_ = 2000;
};

}  // namespace leaguesched::core::api
