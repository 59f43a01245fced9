#include "leaguesched/core/validation/ViolationReport.h"

#include <algorithm>
#include <utility>

namespace leaguesched::core::validation {

std::string ToString(Constraint constraint) {
    switch (constraint) {
        case Constraint::kC1PairCount:
            return "C1";
        case Constraint::kC2GamesPerWeek:
            return "C2";
        case Constraint::kC3Rematch:
            return "C3";
        case Constraint::kC4HomeAway:
            return "C4";
        case Constraint::kC5FieldBalance:
            return "C5";
        case Constraint::kC6WindowBalance:
            return "C6";
        case Constraint::kPartialCycle:
            break;
    }
    return "PARTIAL_CYCLE";
}

std::string ToString(Severity severity) {
    return severity == Severity::kHard ? "hard" : "advisory";
}

void ViolationReport::Add(Constraint constraint, Severity severity, int week_index, std::string message) {
    Violation violation;
    violation.constraint = constraint;
    violation.severity = severity;
    violation.week_index = week_index;
    violation.message = std::move(message);
    violations_.push_back(std::move(violation));
}

void ViolationReport::Merge(const ViolationReport& other) {
    violations_.insert(violations_.end(), other.violations_.begin(), other.violations_.end());
}

size_t ViolationReport::hard_count() const {
    return static_cast<size_t>(std::count_if(violations_.begin(), violations_.end(), [](const Violation& v) {
        return v.severity == Severity::kHard;
    }));
}

size_t ViolationReport::advisory_count() const {
    return violations_.size() - hard_count();
}

size_t ViolationReport::CountFor(Constraint constraint) const {
    return static_cast<size_t>(std::count_if(violations_.begin(), violations_.end(), [&](const Violation& v) {
        return v.constraint == constraint;
    }));
}

std::vector<std::string> ViolationReport::Messages() const {
    std::vector<std::string> messages;
    messages.reserve(violations_.size());
    for (const auto& violation : violations_) {
        messages.push_back("[" + ToString(violation.constraint) + "/" + ToString(violation.severity) + "] " +
                           violation.message);
    }
    return messages;
}

}  // namespace leaguesched::core::validation
