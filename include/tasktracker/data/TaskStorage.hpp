#pragma once

#include <optional>
#include <vector>

#include "tasktracker/core/Task.hpp"

namespace tasktracker {
namespace data {

class TaskStorage
{
public:
    virtual ~TaskStorage() = default;

    virtual std::optional<std::vector<core::Task>> load() const = 0;
    virtual bool save(const std::vector<core::Task> &tasks) = 0;
};

} // namespace data
} // namespace tasktracker
