#include "tasktracker/core/CommandExecutor.hpp"

#include <type_traits>

#include "tasktracker/core/Logging.hpp"
#include "tasktracker/core/OutputHandler.hpp"
#include "tasktracker/core/TaskList.hpp"

namespace tasktracker {
namespace core {

namespace {
template<typename>
constexpr bool AlwaysFalse = false;

const QString Divider = QString(DividerWidth, QLatin1Char('_'));
} // namespace

CommandExecutor::CommandExecutor(TaskList &tasks, OutputHandler &output)
    : m_tasks(tasks)
    , m_output(output)
{
}

CommandExecutor::~CommandExecutor() = default;

ExecutionResult CommandExecutor::execute(const Command &command)
{
    return std::visit([this](const auto &cmd) {
        using T = std::decay_t<decltype(cmd)>;
        if constexpr (std::is_same_v<T, ByeCommand>) {
            return sayGoodbye();
        } else if constexpr (std::is_same_v<T, ListCommand>) {
            return listTasks();
        } else if constexpr (std::is_same_v<T, FindCommand>) {
            return findTasks(cmd.keyword);
        } else if constexpr (std::is_same_v<T, MarkCommand>) {
            return markTask(cmd.index, true);
        } else if constexpr (std::is_same_v<T, UnmarkCommand>) {
            return markTask(cmd.index, false);
        } else if constexpr (std::is_same_v<T, DeleteCommand>) {
            return deleteTask(cmd.index);
        } else if constexpr (std::is_same_v<T, AddTodoCommand> || std::is_same_v<T, AddDeadlineCommand>
                             || std::is_same_v<T, AddEventCommand>) {
            return addTask(cmd.task);
        } else {
            static_assert(AlwaysFalse<T>, "unhandled command variant");
        }
    }, command);
}

ExecutionResult CommandExecutor::markTask(int index, bool done)
{
    const int position = index - 1;
    if (!m_tasks.markDone(position, done)) {
        return reportOutOfBounds(index);
    }
    qCDebug(lcExecutor) << (done ? "marked" : "unmarked") << "task" << index;

    printDivider();
    m_output.print(done ? QStringLiteral("Nice! I've marked this task as done:")
                        : QStringLiteral("OK, I've marked this task as not done yet:"));
    m_output.print(toDisplayString(*m_tasks.taskAt(position)));
    printDivider();
    return {};
}

ExecutionResult CommandExecutor::deleteTask(int index)
{
    const auto removed = m_tasks.remove(index - 1);
    if (!removed) {
        return reportOutOfBounds(index);
    }
    qCDebug(lcExecutor) << "deleted task" << index;

    printDivider();
    m_output.print(QStringLiteral("Noted. I've removed this task:"));
    m_output.print(toDisplayString(*removed));
    printTaskCount();
    printDivider();
    return {};
}

ExecutionResult CommandExecutor::addTask(const Task &task)
{
    m_tasks.add(task);
    qCDebug(lcExecutor) << "added task" << m_tasks.size();

    printDivider();
    m_output.print(QStringLiteral("Got it. I've added this task:"));
    m_output.print(toDisplayString(task));
    printTaskCount();
    printDivider();
    return {};
}

ExecutionResult CommandExecutor::listTasks()
{
    printDivider();
    m_output.print(QStringLiteral("Here are the tasks in your list:"));
    int number = 1;
    for (const auto &task : m_tasks.tasks()) {
        m_output.print(QStringLiteral("%1.%2").arg(QString::number(number++), toDisplayString(task)));
    }
    printDivider();
    return {};
}

ExecutionResult CommandExecutor::findTasks(const QString &keyword)
{
    const auto matches = m_tasks.find(keyword);
    qCDebug(lcExecutor) << "find" << keyword << "matched" << matches.size();

    printDivider();
    m_output.print(QStringLiteral("Here are the matching tasks in your list:"));
    int number = 1;
    for (const auto &task : matches) {
        m_output.print(QStringLiteral("%1.%2").arg(QString::number(number++), toDisplayString(task)));
    }
    printDivider();
    return {};
}

ExecutionResult CommandExecutor::sayGoodbye()
{
    printDivider();
    m_output.print(QStringLiteral("Bye. Hope to see you again soon!"));
    printDivider();
    ExecutionResult result;
    result.status = ExecutionStatus::Exit;
    return result;
}

ExecutionResult CommandExecutor::reportOutOfBounds(int index)
{
    qCDebug(lcExecutor) << "index" << index << "out of bounds for" << m_tasks.size() << "tasks";
    m_output.print(QStringLiteral("index out of bounds"));
    ExecutionResult result;
    result.error = ExecutionError{ index, m_tasks.size() };
    return result;
}

void CommandExecutor::printDivider()
{
    m_output.print(Divider);
}

void CommandExecutor::printTaskCount()
{
    m_output.print(QStringLiteral("Now you have %1 tasks in the list.").arg(m_tasks.size()));
}

} // namespace core
} // namespace tasktracker
