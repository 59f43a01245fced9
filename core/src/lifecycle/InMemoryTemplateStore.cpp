#include "leaguesched/core/lifecycle/InMemoryTemplateStore.h"

#include <algorithm>
#include <set>

namespace leaguesched::core::lifecycle {

bool InMemoryTemplateStore::InsertRows(std::vector<league::ScheduleTemplateRow>& rows, std::string*) {
    for (auto& row : rows) {
        row.id = next_id_++;
        rows_.push_back(row);
    }
    return true;
}

std::vector<league::ScheduleTemplateRow> InMemoryTemplateStore::UncommittedRows(int division_id) const {
    std::vector<league::ScheduleTemplateRow> result;
    for (const auto& row : rows_) {
        if (row.division_id == division_id && !row.is_committed) {
            result.push_back(row);
        }
    }
    return result;
}

std::vector<league::ScheduleTemplateRow> InMemoryTemplateStore::FindRows(const std::vector<int>& template_ids) const {
    const std::set<int> wanted(template_ids.begin(), template_ids.end());
    std::vector<league::ScheduleTemplateRow> result;
    for (const auto& row : rows_) {
        if (wanted.count(row.id) > 0) {
            result.push_back(row);
        }
    }
    return result;
}

bool InMemoryTemplateStore::UpdateRows(const std::vector<league::ScheduleTemplateRow>& rows, std::string* error) {
    for (const auto& row : rows) {
        const auto it = std::find_if(rows_.begin(), rows_.end(), [&](const auto& stored) {
            return stored.id == row.id;
        });
        if (it == rows_.end()) {
            if (error) {
                *error = "Unknown template id " + std::to_string(row.id);
            }
            return false;
        }
    }
    for (const auto& row : rows) {
        *std::find_if(rows_.begin(), rows_.end(), [&](const auto& stored) { return stored.id == row.id; }) = row;
    }
    return true;
}

bool InMemoryTemplateStore::RemoveRows(const std::vector<int>& template_ids, std::string*) {
    const std::set<int> doomed(template_ids.begin(), template_ids.end());
    rows_.erase(std::remove_if(rows_.begin(), rows_.end(),
                               [&](const auto& row) { return doomed.count(row.id) > 0; }),
                rows_.end());
    return true;
}

}  // namespace leaguesched::core::lifecycle
