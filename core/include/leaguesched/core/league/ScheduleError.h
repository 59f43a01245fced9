#pragma once

#include <string>
#include <utility>

namespace leaguesched::core::league {

enum class ScheduleErrorCode {
    kNone,
    kInvalidTeamCount,
    kInvalidWeekNumber,
    kMissingWeekDate,
    kStoreFailure,
    kConfigError,
};

struct ScheduleError {
    ScheduleErrorCode code = ScheduleErrorCode::kNone;
    std::string message;
};

// Fills *error when error is non-null. Always returns false so callers can
// write `return SetError(...)`.
inline bool SetError(ScheduleError* error, ScheduleErrorCode code, std::string message) {
    if (error) {
        error->code = code;
        error->message = std::move(message);
    }
    return false;
}

}  // namespace leaguesched::core::league
