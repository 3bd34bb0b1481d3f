#pragma once

#include <QString>

namespace tasktracker {
namespace core {

// Width of the underscore line framing every response.
constexpr int DividerWidth = 60;

class OutputHandler
{
public:
    virtual ~OutputHandler() = default;
    virtual void print(const QString &line) = 0;
};

} // namespace core
} // namespace tasktracker
