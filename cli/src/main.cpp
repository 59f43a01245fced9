#include "leaguesched/core/api/GeneratorConfig.h"
#include "leaguesched/core/api/ScheduleService.h"
#include "leaguesched/core/lifecycle/IMatchCreator.h"

#include <iostream>
#include <string>

namespace {

using leaguesched::core::api::GeneratorConfig;
using leaguesched::core::api::ScheduleService;

constexpr int kLogTail = 200;

// Prints each match instead of creating it in an external system.
class LoggingMatchCreator : public leaguesched::core::lifecycle::IMatchCreator {
public:
    bool CreateMatch(const leaguesched::core::lifecycle::MatchRequest& request,
                     int* match_id,
                     std::string*) override {
        ++next_id_;
        if (match_id) {
            *match_id = next_id_;
        }
        std::cout << "[leagueschedcli] match " << next_id_ << ": week " << request.week_number << ' '
                  << request.date.ToString() << ' ' << request.time.ToString() << ' ' << request.field << ' '
                  << request.home_team_id << " vs " << request.away_team_id << " ("
                  << leaguesched::core::league::ToString(request.week_type) << ")\n";
        return true;
    }

private:
    int next_id_ = 0;
};

void PrintUsage() {
    std::cerr << "Usage: leagueschedcli [--persist|--commit|--delete|--preview] <config.json>" << '\n';
}

void FlushLog(const ScheduleService& service) {
    const auto lines = service.getLastLogLines(kLogTail);
    if (!lines.empty()) {
        std::cerr << lines << '\n';
    }
}

int Fail(const ScheduleService& service, const std::string& message) {
    FlushLog(service);
    std::cerr << "[leagueschedcli] " << message << '\n';
    return 1;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return 1;
    }

    std::string action;
    std::string config_path;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--persist" || arg == "--commit" || arg == "--delete" || arg == "--preview") {
            if (!action.empty()) {
                std::cerr << "[leagueschedcli] " << action << " and " << arg << " are mutually exclusive." << '\n';
                return 1;
            }
            action = arg;
        } else if (config_path.empty()) {
            config_path = arg;
        }
    }

    if (config_path.empty()) {
        PrintUsage();
        return 1;
    }

    std::cout << "[leagueschedcli] Generator config: " << config_path << '\n';

    GeneratorConfig config;
    std::string config_error;
    if (!GeneratorConfig::LoadFromFile(config_path, config, &config_error)) {
        std::cerr << "[leagueschedcli] " << config_error << '\n';
        return 1;
    }

    ScheduleService service;
    leaguesched::core::league::ScheduleError error;

    if (action == "--commit") {
        LoggingMatchCreator creator;
        if (!service.CommitTemplates(config, creator, &error)) {
            return Fail(service, error.message);
        }
        FlushLog(service);
        return 0;
    }
    if (action == "--delete") {
        if (!service.DeleteTemplates(config, &error)) {
            return Fail(service, error.message);
        }
        FlushLog(service);
        return 0;
    }
    if (action == "--preview") {
        leaguesched::core::lifecycle::SchedulePreview preview;
        if (!service.PreviewTemplates(config, preview, &error)) {
            return Fail(service, error.message);
        }
        for (const auto& [week_number, entries] : preview) {
            std::cout << "Week " << week_number << '\n';
            for (const auto& entry : entries) {
                std::cout << "  " << entry.date.ToString() << ' ' << entry.time.ToString() << ' ' << entry.field
                          << "  " << entry.home_team_name << " vs " << entry.away_team_name << "  ["
                          << leaguesched::core::league::ToString(entry.week_type) << "] #" << entry.template_id
                          << '\n';
            }
        }
        FlushLog(service);
        return 0;
    }

    leaguesched::core::api::GenerationResult result;
    if (!service.Generate(config, result, &error)) {
        return Fail(service, error.message);
    }
    if (action == "--persist" && !service.PersistTemplates(config, result, &error)) {
        return Fail(service, error.message);
    }

    std::string write_error;
    if (!service.WriteOutputs(config, result, &write_error)) {
        return Fail(service, write_error);
    }

    FlushLog(service);
    for (const auto& message : result.report.Messages()) {
        std::cout << "[leagueschedcli] " << message << '\n';
    }
    return result.report.HasHardViolations() ? 2 : 0;
}
