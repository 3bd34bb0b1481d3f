#pragma once

#include "tasktracker/data/TaskStorage.hpp"

namespace tasktracker {
namespace data {

class InMemoryTaskStorage : public TaskStorage
{
public:
    InMemoryTaskStorage();
    explicit InMemoryTaskStorage(std::vector<core::Task> tasks);
    ~InMemoryTaskStorage() override;

    std::optional<std::vector<core::Task>> load() const override;
    bool save(const std::vector<core::Task> &tasks) override;

    int saveCount() const;

private:
    std::vector<core::Task> m_tasks;
    int m_saveCount = 0;
};

} // namespace data
} // namespace tasktracker
