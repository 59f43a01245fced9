#include "leaguesched/core/api/ScheduleService.h"

#include "leaguesched/core/export/ExportWriter.h"
#include "leaguesched/core/lifecycle/JsonTemplateStore.h"
#include "leaguesched/core/schedule/WeekPlanBuilder.h"
#include "leaguesched/core/season/SeasonConfiguration.h"
#include "leaguesched/core/tournament/PairingGenerator.h"
#include "leaguesched/core/validation/ConstraintValidator.h"

#include <algorithm>
#include <sstream>

namespace leaguesched::core::api {

namespace {

// Weeks that consume one generated pairing.
int PairingWeeksNeeded(league::DivisionType type, const std::vector<league::WeekDescriptor>& weeks) {
    return static_cast<int>(std::count_if(weeks.begin(), weeks.end(), [&](const auto& week) {
        switch (week.week_type) {
            case league::WeekType::kRegular:
            case league::WeekType::kPractice:
                return true;
            case league::WeekType::kMixed:
                return type == league::DivisionType::kClassic;
            default:
                return false;
        }
    }));
}

}  // namespace

roster::RosterResolver ScheduleService::BuildRoster(const GeneratorConfig& config) {
    std::vector<league::Team> teams;
    teams.reserve(config.teams.size());
    for (const auto& team : config.teams) {
        teams.push_back({team.id, team.name, config.division.id});
    }
    return roster::RosterResolver(std::move(teams));
}

bool ScheduleService::BuildWeekDescriptors(const GeneratorConfig& config,
                                           std::vector<league::WeekDescriptor>& weeks,
                                           league::ScheduleError* error) {
    weeks.clear();
    if (config.weeks.empty()) {
        const auto start = util::CalendarDate::Parse(config.season.start_date);
        if (!start) {
            return league::SetError(error, league::ScheduleErrorCode::kConfigError,
                                    "season.start_date must be YYYY-MM-DD, got '" + config.season.start_date + "'");
        }
        weeks = season::BuildWeekDescriptors(config.season.layout, *start, config.season.days_between_weeks);
        return true;
    }

    int order = 0;
    for (const auto& entry : config.weeks) {
        league::WeekDescriptor week;
        week.week_order = ++order;
        if (!entry.date.empty()) {
            week.date = util::CalendarDate::Parse(entry.date);
            if (!week.date) {
                weeks.clear();
                return league::SetError(error, league::ScheduleErrorCode::kConfigError,
                                        "Week " + std::to_string(order) + " has an invalid date '" + entry.date +
                                            "'");
            }
        }
        week.week_type = league::ParseWeekType(entry.week_type);
        week.week_type_tag = entry.week_type;
        week.playoff_round = entry.playoff_round;
        week.is_practice_session = entry.is_practice_session;
        week.description = entry.description;
        weeks.push_back(std::move(week));
    }
    return true;
}

bool ScheduleService::Generate(const GeneratorConfig& config,
                               GenerationResult& result,
                               league::ScheduleError* error) {
    result = GenerationResult{};
    const auto log_fn = logger();
    result.division_type = league::ParseDivisionType(config.division.type);

    const auto start_time = util::ClockTime::Parse(config.schedule.start_time);
    if (!start_time) {
        return league::SetError(error, league::ScheduleErrorCode::kConfigError,
                                "schedule.start_time must be HH:MM, got '" + config.schedule.start_time + "'");
    }
    if (config.schedule.match_duration_minutes <= 0) {
        return league::SetError(error, league::ScheduleErrorCode::kConfigError,
                                "schedule.match_duration_minutes must be positive");
    }

    const auto roster = BuildRoster(config);
    if (!BuildWeekDescriptors(config, result.weeks, error)) {
        return false;
    }

    const int pairing_weeks = PairingWeeksNeeded(result.division_type, result.weeks);
    tournament::PairingGenerator generator(log_fn);
    tournament::SeasonPairings pairings;
    if (!generator.Generate(roster.real_team_ids(), pairing_weeks, pairings, error)) {
        return false;
    }

    schedule::WeekPlanSettings settings;
    settings.division_type = result.division_type;
    settings.division_id = config.division.id;
    settings.fields = config.schedule.fields;
    settings.start_time = *start_time;
    settings.match_minutes = config.schedule.match_duration_minutes;

    schedule::WeekPlanBuilder builder(roster, settings, log_fn);
    schedule::WeekPlanResult plan;
    if (!builder.Build(result.weeks, pairings.weeks, plan, error)) {
        return false;
    }

    validation::ConstraintValidator validator(log_fn);
    result.report = std::move(pairings.report);
    result.report.Merge(validator.ValidateAssignments(plan.regular_weeks, plan.regular_time_slots));
    result.rows = std::move(plan.rows);
    result.retried_weeks = pairings.retried_weeks;
    result.skipped_weeks = plan.skipped_weeks;

    std::ostringstream summary;
    summary << "[leaguesched] " << league::ToString(result.division_type) << " division " << config.division.id
            << ": " << result.weeks.size() << " weeks, " << result.rows.size() << " rows, "
            << result.report.hard_count() << " hard / " << result.report.advisory_count() << " advisory findings";
    AppendLogLine(summary.str());
    return true;
}

bool ScheduleService::WriteOutputs(const GeneratorConfig& config,
                                   const GenerationResult& result,
                                   std::string* error) {
    const auto roster = BuildRoster(config);
    const auto fail = [&](const std::string& path) {
        if (error && error->empty()) {
            *error = "Failed to write " + path;
        }
        AppendLogLine("[leaguesched] Failed to write " + path);
        return false;
    };
    if (!config.output.preview_json.empty() &&
        !exporter::WritePreviewJson(config.output.preview_json, lifecycle::BuildPreview(result.rows, &roster))) {
        return fail(config.output.preview_json);
    }
    if (!config.output.schedule_csv.empty() &&
        !exporter::WriteScheduleCsv(config.output.schedule_csv, result.rows, roster)) {
        return fail(config.output.schedule_csv);
    }
    if (!config.output.violations_json.empty() &&
        !exporter::WriteViolationReportJson(config.output.violations_json, result.report)) {
        return fail(config.output.violations_json);
    }
    if (!config.output.schedule_csv.empty()) {
        AppendLogLine("[leaguesched] " + std::to_string(result.rows.size()) + " template rows written to " +
                      config.output.schedule_csv);
    }
    return true;
}

template <typename Operation>
bool ScheduleService::WithTemplateStore(const GeneratorConfig& config,
                                        lifecycle::IMatchCreator* match_creator,
                                        league::ScheduleError* error,
                                        Operation operation) {
    if (config.output.template_store_json.empty()) {
        return league::SetError(error, league::ScheduleErrorCode::kConfigError,
                                "output.template_store_json is not set");
    }
    lifecycle::JsonTemplateStore store(config.output.template_store_json);
    std::string store_error;
    if (!store.Load(&store_error)) {
        return league::SetError(error, league::ScheduleErrorCode::kStoreFailure, store_error);
    }
    const auto roster = BuildRoster(config);
    lifecycle::TemplateLifecycle templates(store, match_creator, &roster, logger());
    return operation(templates);
}

bool ScheduleService::PersistTemplates(const GeneratorConfig& config,
                                       GenerationResult& result,
                                       league::ScheduleError* error) {
    return WithTemplateStore(config, nullptr, error, [&](lifecycle::TemplateLifecycle& templates) {
        return templates.Persist(result.rows, error);
    });
}

bool ScheduleService::CommitTemplates(const GeneratorConfig& config,
                                      lifecycle::IMatchCreator& match_creator,
                                      league::ScheduleError* error) {
    return WithTemplateStore(config, &match_creator, error, [&](lifecycle::TemplateLifecycle& templates) {
        return templates.Commit(config.division.id, std::nullopt, error);
    });
}

bool ScheduleService::DeleteTemplates(const GeneratorConfig& config, league::ScheduleError* error) {
    return WithTemplateStore(config, nullptr, error, [&](lifecycle::TemplateLifecycle& templates) {
        return templates.Delete(config.division.id, std::nullopt, error);
    });
}

bool ScheduleService::PreviewTemplates(const GeneratorConfig& config,
                                       lifecycle::SchedulePreview& preview,
                                       league::ScheduleError* error) {
    return WithTemplateStore(config, nullptr, error, [&](lifecycle::TemplateLifecycle& templates) {
        preview = templates.Preview(config.division.id);
        return true;
    });
}

std::string ScheduleService::getLastLogLines(int n) const {
    std::lock_guard<std::mutex> lock(log_mutex_);
    const int start = std::max(0, static_cast<int>(log_lines_.size()) - n);
    std::ostringstream output;
    for (size_t i = static_cast<size_t>(start); i < log_lines_.size(); ++i) {
        output << log_lines_[i];
        if (i + 1 < log_lines_.size()) {
            output << '\n';
        }
    }
    return output.str();
}

util::LogFn ScheduleService::logger() {
    return [this](const std::string& line) { AppendLogLine(line); };
}

void ScheduleService::AppendLogLine(const std::string& line) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    if (log_lines_.size() >= max_log_lines_) {
        log_lines_.pop_front();
    }
    log_lines_.push_back(line);
}

}  // namespace leaguesched::core::api
