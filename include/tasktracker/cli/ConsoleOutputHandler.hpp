#pragma once

#include <QTextStream>
#include <cstdio>

#include "tasktracker/core/OutputHandler.hpp"

namespace tasktracker {
namespace cli {

class ConsoleOutputHandler : public core::OutputHandler
{
public:
    explicit ConsoleOutputHandler(FILE *stream = stdout);
    ~ConsoleOutputHandler() override;

    void print(const QString &line) override;

private:
    QTextStream m_stream;
};

} // namespace cli
} // namespace tasktracker
