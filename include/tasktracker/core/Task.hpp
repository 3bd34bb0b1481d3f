#pragma once

#include <QChar>
#include <QString>
#include <variant>

namespace tasktracker {
namespace core {

enum class TaskKind
{
    Todo,
    Deadline,
    Event,
};

struct TodoTask
{
    QString description;
    bool done = false;
};

struct DeadlineTask
{
    QString description;
    QString by;
    bool done = false;
};

struct EventTask
{
    QString description;
    QString from;
    QString to;
    bool done = false;
};

using Task = std::variant<TodoTask, DeadlineTask, EventTask>;

Task makeTodo(QString description);
Task makeDeadline(QString description, QString by);
Task makeEvent(QString description, QString from, QString to);

TaskKind taskKind(const Task &task);
const QString &taskDescription(const Task &task);
bool isTaskDone(const Task &task);
void setTaskDone(Task &task, bool done);

// Single-letter tag shown in the first bracket of the display string.
QChar typeMarker(TaskKind kind);

// "[T][X] read book", "[D][ ] return book (by: Sunday)",
// "[E][ ] meeting (from: Mon 2pm to: 4pm)"
QString toDisplayString(const Task &task);

bool operator==(const TodoTask &lhs, const TodoTask &rhs);
bool operator==(const DeadlineTask &lhs, const DeadlineTask &rhs);
bool operator==(const EventTask &lhs, const EventTask &rhs);

} // namespace core
} // namespace tasktracker
