#pragma once

#include <cstddef>
#include <optional>

#include "tasktracker/core/Command.hpp"

namespace tasktracker {
namespace core {

class OutputHandler;
class TaskList;

enum class ExecutionStatus
{
    Continue,
    Exit,
};

// Raised when a 1-based index names no task; the list is left untouched.
struct ExecutionError
{
    int index = 0;
    std::size_t taskCount = 0;
};

struct ExecutionResult
{
    ExecutionStatus status = ExecutionStatus::Continue;
    std::optional<ExecutionError> error;
};

class CommandExecutor
{
public:
    CommandExecutor(TaskList &tasks, OutputHandler &output);
    ~CommandExecutor();

    ExecutionResult execute(const Command &command);

private:
    ExecutionResult markTask(int index, bool done);
    ExecutionResult deleteTask(int index);
    ExecutionResult addTask(const Task &task);
    ExecutionResult listTasks();
    ExecutionResult findTasks(const QString &keyword);
    ExecutionResult sayGoodbye();
    ExecutionResult reportOutOfBounds(int index);

    void printDivider();
    void printTaskCount();

    TaskList &m_tasks;
    OutputHandler &m_output;
};

} // namespace core
} // namespace tasktracker
