#pragma once

#include <QString>
#include <memory>

namespace tasktracker {
namespace data {
class TaskStorage;
}

namespace core {

class CommandExecutor;
class CommandParser;
class OutputHandler;
class TaskList;

class Session
{
public:
    Session(data::TaskStorage &storage, OutputHandler &output);
    ~Session();

    // Replaces the task list with the stored tasks. Returns false and keeps
    // an empty list when the storage cannot be read.
    bool start();

    // Parses and executes one line. Returns false once the user said bye.
    bool handleLine(const QString &line);

    bool finish();

    bool isFinished() const;
    const TaskList &tasks() const;

private:
    data::TaskStorage &m_storage;
    OutputHandler &m_output;
    std::unique_ptr<TaskList> m_tasks;
    std::unique_ptr<CommandParser> m_parser;
    std::unique_ptr<CommandExecutor> m_executor;
    bool m_finished = false;
};

} // namespace core
} // namespace tasktracker
