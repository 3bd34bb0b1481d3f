#include "tasktracker/data/InMemoryTaskStorage.hpp"

namespace tasktracker {
namespace data {

InMemoryTaskStorage::InMemoryTaskStorage() = default;

InMemoryTaskStorage::InMemoryTaskStorage(std::vector<core::Task> tasks)
    : m_tasks(std::move(tasks))
{
}

InMemoryTaskStorage::~InMemoryTaskStorage() = default;

std::optional<std::vector<core::Task>> InMemoryTaskStorage::load() const
{
    return m_tasks;
}

bool InMemoryTaskStorage::save(const std::vector<core::Task> &tasks)
{
    m_tasks = tasks;
    ++m_saveCount;
    return true;
}

int InMemoryTaskStorage::saveCount() const
{
    return m_saveCount;
}

} // namespace data
} // namespace tasktracker
