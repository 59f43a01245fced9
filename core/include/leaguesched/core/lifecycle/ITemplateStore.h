#pragma once

#include "leaguesched/core/league/LeagueTypes.h"

#include <string>
#include <vector>

namespace leaguesched::core::lifecycle {

// Storage for generated template rows. Each mutating call is all-or-nothing.
class ITemplateStore {
public:
    virtual ~ITemplateStore() = default;
    // Assigns ids to the rows in place.
    virtual bool InsertRows(std::vector<league::ScheduleTemplateRow>& rows, std::string* error) = 0;
    virtual std::vector<league::ScheduleTemplateRow> UncommittedRows(int division_id) const = 0;
    // Unknown ids are left out of the result.
    virtual std::vector<league::ScheduleTemplateRow> FindRows(const std::vector<int>& template_ids) const = 0;
    // Rows are matched by id; an unknown id fails the whole call.
    virtual bool UpdateRows(const std::vector<league::ScheduleTemplateRow>& rows, std::string* error) = 0;
    virtual bool RemoveRows(const std::vector<int>& template_ids, std::string* error) = 0;
};

}  // namespace leaguesched::core::lifecycle
