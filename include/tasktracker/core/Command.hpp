#pragma once

#include <QString>
#include <variant>

#include "tasktracker/core/Task.hpp"

namespace tasktracker {
namespace core {

struct ByeCommand
{
};

struct ListCommand
{
};

struct FindCommand
{
    QString keyword;
};

// Indices on commands are 1-based, as typed by the user.
struct MarkCommand
{
    int index = 0;
};

struct UnmarkCommand
{
    int index = 0;
};

struct DeleteCommand
{
    int index = 0;
};

struct AddTodoCommand
{
    Task task;
};

struct AddDeadlineCommand
{
    Task task;
};

struct AddEventCommand
{
    Task task;
};

using Command = std::variant<ByeCommand,
                             ListCommand,
                             FindCommand,
                             MarkCommand,
                             UnmarkCommand,
                             DeleteCommand,
                             AddTodoCommand,
                             AddDeadlineCommand,
                             AddEventCommand>;

} // namespace core
} // namespace tasktracker
