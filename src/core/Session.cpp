#include "tasktracker/core/Session.hpp"

#include "tasktracker/core/CommandExecutor.hpp"
#include "tasktracker/core/CommandParser.hpp"
#include "tasktracker/core/Logging.hpp"
#include "tasktracker/core/OutputHandler.hpp"
#include "tasktracker/core/TaskList.hpp"
#include "tasktracker/data/TaskStorage.hpp"

namespace tasktracker {
namespace core {

Session::Session(data::TaskStorage &storage, OutputHandler &output)
    : m_storage(storage)
    , m_output(output)
    , m_tasks(std::make_unique<TaskList>())
    , m_parser(std::make_unique<CommandParser>())
    , m_executor(std::make_unique<CommandExecutor>(*m_tasks, m_output))
{
}

Session::~Session() = default;

bool Session::start()
{
    auto stored = m_storage.load();
    if (!stored) {
        qCWarning(lcSession) << "could not load stored tasks, starting with an empty list";
        *m_tasks = TaskList();
        return false;
    }
    *m_tasks = TaskList(std::move(*stored));
    qCDebug(lcSession) << "session started with" << m_tasks->size() << "tasks";
    return true;
}

bool Session::handleLine(const QString &line)
{
    if (m_finished) {
        return false;
    }

    const ParseResult parsed = m_parser->parse(line);
    if (const auto *error = std::get_if<ParseError>(&parsed)) {
        const QString divider(DividerWidth, QLatin1Char('_'));
        m_output.print(divider);
        m_output.print(error->message);
        m_output.print(divider);
        return true;
    }

    const ExecutionResult result = m_executor->execute(std::get<Command>(parsed));
    if (result.status == ExecutionStatus::Exit) {
        m_finished = true;
    }
    return !m_finished;
}

bool Session::finish()
{
    m_finished = true;
    if (!m_storage.save(m_tasks->tasks())) {
        qCWarning(lcSession) << "could not save" << m_tasks->size() << "tasks";
        return false;
    }
    return true;
}

bool Session::isFinished() const
{
    return m_finished;
}

const TaskList &Session::tasks() const
{
    return *m_tasks;
}

} // namespace core
} // namespace tasktracker
