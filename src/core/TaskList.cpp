#include "tasktracker/core/TaskList.hpp"

namespace tasktracker {
namespace core {

TaskList::TaskList() = default;

TaskList::TaskList(std::vector<Task> tasks)
    : m_tasks(std::move(tasks))
{
}

TaskList::~TaskList() = default;

void TaskList::add(Task task)
{
    m_tasks.push_back(std::move(task));
}

std::size_t TaskList::size() const
{
    return m_tasks.size();
}

bool TaskList::isEmpty() const
{
    return m_tasks.empty();
}

std::optional<Task> TaskList::taskAt(int index) const
{
    if (!contains(index)) {
        return std::nullopt;
    }
    return m_tasks[static_cast<std::size_t>(index)];
}

bool TaskList::markDone(int index, bool done)
{
    if (!contains(index)) {
        return false;
    }
    setTaskDone(m_tasks[static_cast<std::size_t>(index)], done);
    return true;
}

std::optional<Task> TaskList::remove(int index)
{
    if (!contains(index)) {
        return std::nullopt;
    }
    const auto it = m_tasks.begin() + static_cast<long>(index);
    Task removed = std::move(*it);
    m_tasks.erase(it);
    return removed;
}

std::vector<Task> TaskList::find(const QString &keyword) const
{
    std::vector<Task> matches;
    for (const auto &task : m_tasks) {
        if (taskDescription(task).contains(keyword, Qt::CaseSensitive)) {
            matches.push_back(task);
        }
    }
    return matches;
}

const std::vector<Task> &TaskList::tasks() const
{
    return m_tasks;
}

bool TaskList::contains(int index) const
{
    return index >= 0 && static_cast<std::size_t>(index) < m_tasks.size();
}

} // namespace core
} // namespace tasktracker
