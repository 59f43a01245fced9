#pragma once

#include <string>
#include <vector>

namespace leaguesched::core::validation {

enum class Constraint {
    kC1PairCount,
    kC2GamesPerWeek,
    kC3Rematch,
    kC4HomeAway,
    kC5FieldBalance,
    kC6WindowBalance,
    kPartialCycle,
};

enum class Severity {
    kHard,
    kAdvisory,
};

std::string ToString(Constraint constraint);
std::string ToString(Severity severity);

struct Violation {
    Constraint constraint = Constraint::kC1PairCount;
    Severity severity = Severity::kHard;
    // 0-based week index, -1 for season-wide findings.
    int week_index = -1;
    std::string message;
};

class ViolationReport {
public:
    void Add(Constraint constraint, Severity severity, int week_index, std::string message);
    void Merge(const ViolationReport& other);

    const std::vector<Violation>& violations() const { return violations_; }
    bool empty() const { return violations_.empty(); }
    size_t hard_count() const;
    size_t advisory_count() const;
    bool HasHardViolations() const { return hard_count() > 0; }
    size_t CountFor(Constraint constraint) const;
    std::vector<std::string> Messages() const;

private:
    std::vector<Violation> violations_;
};

}  // namespace leaguesched::core::validation
