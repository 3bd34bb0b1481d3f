#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "tasktracker/core/Task.hpp"

namespace tasktracker {
namespace core {

// Ordered task collection. Indices are 0-based; removal compacts the list.
class TaskList
{
public:
    TaskList();
    explicit TaskList(std::vector<Task> tasks);
    ~TaskList();

    void add(Task task);
    std::size_t size() const;
    bool isEmpty() const;

    std::optional<Task> taskAt(int index) const;
    bool markDone(int index, bool done);
    std::optional<Task> remove(int index);

    // Case-sensitive substring match on the description, in list order.
    std::vector<Task> find(const QString &keyword) const;

    const std::vector<Task> &tasks() const;

private:
    bool contains(int index) const;

    std::vector<Task> m_tasks;
};

} // namespace core
} // namespace tasktracker
