#pragma once

#include "leaguesched/core/lifecycle/InMemoryTemplateStore.h"

#include <string>
#include <vector>

namespace leaguesched::core::lifecycle {

// InMemoryTemplateStore backed by a JSON file. Every mutating call rewrites
// the file once; when the write fails the in-memory rows are restored.
class JsonTemplateStore : public InMemoryTemplateStore {
public:
    explicit JsonTemplateStore(std::string path);

    // A missing file is an empty store.
    bool Load(std::string* error);

    bool InsertRows(std::vector<league::ScheduleTemplateRow>& rows, std::string* error) override;
    bool UpdateRows(const std::vector<league::ScheduleTemplateRow>& rows, std::string* error) override;
    bool RemoveRows(const std::vector<int>& template_ids, std::string* error) override;

    const std::string& path() const { return path_; }

private:
    bool Save(std::string* error) const;
    template <typename Mutation>
    bool Apply(Mutation mutation, std::string* error);

    std::string path_;
};

}  // namespace leaguesched::core::lifecycle
