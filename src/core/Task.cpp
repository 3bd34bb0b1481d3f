#include "tasktracker/core/Task.hpp"

#include <type_traits>
#include <utility>

namespace tasktracker {
namespace core {

namespace {
template<typename>
constexpr bool AlwaysFalse = false;

QString statusBox(bool done)
{
    return done ? QStringLiteral("[X]") : QStringLiteral("[ ]");
}
} // namespace

Task makeTodo(QString description)
{
    TodoTask todo;
    todo.description = std::move(description);
    return todo;
}

Task makeDeadline(QString description, QString by)
{
    DeadlineTask deadline;
    deadline.description = std::move(description);
    deadline.by = std::move(by);
    return deadline;
}

Task makeEvent(QString description, QString from, QString to)
{
    EventTask event;
    event.description = std::move(description);
    event.from = std::move(from);
    event.to = std::move(to);
    return event;
}

TaskKind taskKind(const Task &task)
{
    return std::visit([](const auto &value) {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, TodoTask>) {
            return TaskKind::Todo;
        } else if constexpr (std::is_same_v<T, DeadlineTask>) {
            return TaskKind::Deadline;
        } else if constexpr (std::is_same_v<T, EventTask>) {
            return TaskKind::Event;
        } else {
            static_assert(AlwaysFalse<T>, "unhandled task variant");
        }
    }, task);
}

const QString &taskDescription(const Task &task)
{
    return std::visit([](const auto &value) -> const QString & { return value.description; }, task);
}

bool isTaskDone(const Task &task)
{
    return std::visit([](const auto &value) { return value.done; }, task);
}

void setTaskDone(Task &task, bool done)
{
    std::visit([done](auto &value) { value.done = done; }, task);
}

QChar typeMarker(TaskKind kind)
{
    switch (kind) {
    case TaskKind::Deadline:
        return QLatin1Char('D');
    case TaskKind::Event:
        return QLatin1Char('E');
    case TaskKind::Todo:
    default:
        return QLatin1Char('T');
    }
}

QString toDisplayString(const Task &task)
{
    const QString prefix = QStringLiteral("[%1]%2 %3")
                               .arg(QString(typeMarker(taskKind(task))), statusBox(isTaskDone(task)),
                                    taskDescription(task));

    return std::visit([&prefix](const auto &value) -> QString {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, TodoTask>) {
            return prefix;
        } else if constexpr (std::is_same_v<T, DeadlineTask>) {
            return prefix + QStringLiteral(" (by: %1)").arg(value.by);
        } else if constexpr (std::is_same_v<T, EventTask>) {
            return prefix + QStringLiteral(" (from: %1 to: %2)").arg(value.from, value.to);
        } else {
            static_assert(AlwaysFalse<T>, "unhandled task variant");
        }
    }, task);
}

bool operator==(const TodoTask &lhs, const TodoTask &rhs)
{
    return lhs.description == rhs.description && lhs.done == rhs.done;
}

bool operator==(const DeadlineTask &lhs, const DeadlineTask &rhs)
{
    return lhs.description == rhs.description && lhs.by == rhs.by && lhs.done == rhs.done;
}

bool operator==(const EventTask &lhs, const EventTask &rhs)
{
    return lhs.description == rhs.description && lhs.from == rhs.from && lhs.to == rhs.to
           && lhs.done == rhs.done;
}

} // namespace core
} // namespace tasktracker
