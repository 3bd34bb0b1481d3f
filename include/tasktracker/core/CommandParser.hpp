#pragma once

#include <QString>
#include <variant>

#include "tasktracker/core/Command.hpp"

namespace tasktracker {
namespace core {

enum class ParseErrorKind
{
    UnrecognizedCommand,
    InvalidInput,
};

struct ParseError
{
    ParseErrorKind kind = ParseErrorKind::InvalidInput;
    QString message;
};

using ParseResult = std::variant<Command, ParseError>;

/**
 * Turns one line of user input into a Command.
 *
 * Shapes are tried in a fixed order and the first match wins:
 * bye, mark <n>, list, delete <n>, find, unmark <n>, todo, deadline, event.
 * <n> must be 1..100 written without a leading zero. A recognised keyword
 * with malformed arguments yields InvalidInput; anything else yields
 * UnrecognizedCommand.
 *
 * Field extraction skips exactly one character after a keyword or marker
 * and ends at the first occurrence of the next marker, dropping the space
 * in front of it, so "deadline return book /by Sunday" gives "return book"
 * and "Sunday".
 */
class CommandParser
{
public:
    CommandParser();
    ~CommandParser();

    ParseResult parse(const QString &input) const;
};

bool isParseError(const ParseResult &result);

} // namespace core
} // namespace tasktracker
