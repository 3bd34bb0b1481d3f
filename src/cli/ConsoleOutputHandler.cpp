#include "tasktracker/cli/ConsoleOutputHandler.hpp"

namespace tasktracker {
namespace cli {

ConsoleOutputHandler::ConsoleOutputHandler(FILE *stream)
    : m_stream(stream, QIODevice::WriteOnly)
{
    m_stream.setCodec("UTF-8");
}

ConsoleOutputHandler::~ConsoleOutputHandler()
{
    m_stream.flush();
}

void ConsoleOutputHandler::print(const QString &line)
{
    m_stream << line << '\n';
    m_stream.flush();
}

} // namespace cli
} // namespace tasktracker
