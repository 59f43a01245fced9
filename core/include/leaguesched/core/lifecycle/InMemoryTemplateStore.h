#pragma once

#include "leaguesched/core/lifecycle/ITemplateStore.h"

#include <string>
#include <vector>

namespace leaguesched::core::lifecycle {

class InMemoryTemplateStore : public ITemplateStore {
public:
    bool InsertRows(std::vector<league::ScheduleTemplateRow>& rows, std::string* error) override;
    std::vector<league::ScheduleTemplateRow> UncommittedRows(int division_id) const override;
    std::vector<league::ScheduleTemplateRow> FindRows(const std::vector<int>& template_ids) const override;
    bool UpdateRows(const std::vector<league::ScheduleTemplateRow>& rows, std::string* error) override;
    bool RemoveRows(const std::vector<int>& template_ids, std::string* error) override;

    const std::vector<league::ScheduleTemplateRow>& rows() const { return rows_; }

protected:
    std::vector<league::ScheduleTemplateRow> rows_;
    int next_id_ = 1;
};

}  // namespace leaguesched::core::lifecycle
