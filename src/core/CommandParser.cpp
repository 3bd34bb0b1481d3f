#include "tasktracker/core/CommandParser.hpp"

#include <QRegularExpression>
#include <QStringList>
#include <optional>

#include "tasktracker/core/Logging.hpp"

namespace tasktracker {
namespace core {

namespace {
const QString ByeKeyword = QStringLiteral("bye");
const QString ListKeyword = QStringLiteral("list");
const QString MarkKeyword = QStringLiteral("mark");
const QString UnmarkKeyword = QStringLiteral("unmark");
const QString DeleteKeyword = QStringLiteral("delete");
const QString FindKeyword = QStringLiteral("find");
const QString TodoKeyword = QStringLiteral("todo");
const QString DeadlineKeyword = QStringLiteral("deadline");
const QString EventKeyword = QStringLiteral("event");

const QString ByMarker = QStringLiteral("/by");
const QString FromMarker = QStringLiteral("/from");
const QString ToMarker = QStringLiteral("/to");

// "<keyword> <n>" over the whole input, n in 1..100 without a leading zero.
bool matchesIndexedShape(const QString &input, const QString &keyword)
{
    const QRegularExpression pattern(
        QRegularExpression::anchoredPattern(QStringLiteral("%1 (100|[1-9]|[1-9][0-9])").arg(keyword)));
    return pattern.match(input).hasMatch();
}

// Splits on single spaces. Inner empty parts are kept, trailing ones dropped.
QStringList splitOnSpace(const QString &input)
{
    QStringList parts = input.split(QLatin1Char(' '));
    while (!parts.isEmpty() && parts.last().isEmpty()) {
        parts.removeLast();
    }
    return parts;
}

bool hasFirstToken(const QString &input, const QString &keyword)
{
    const QStringList parts = splitOnSpace(input);
    return !parts.isEmpty() && parts.first() == keyword;
}

std::optional<QString> substring(const QString &text, int begin, int end)
{
    if (begin < 0 || end > text.size() || begin > end) {
        return std::nullopt;
    }
    return text.mid(begin, end - begin);
}

// Text from one character past the first `prefix` up to the first `marker`,
// minus the single space that separates it from the marker.
std::optional<QString> textBetween(const QString &input, const QString &prefix, const QString &marker)
{
    const int begin = input.indexOf(prefix) + prefix.size() + 1;
    const int end = input.indexOf(marker);
    auto text = substring(input, begin, end);
    if (text && text->endsWith(QLatin1Char(' '))) {
        text->chop(1);
    }
    return text;
}

// Text from one character past the first `prefix` to the end of the input.
std::optional<QString> textAfter(const QString &input, const QString &prefix)
{
    const int begin = input.indexOf(prefix) + prefix.size() + 1;
    return substring(input, begin, input.size());
}

ParseError invalidInput(const QString &keyword)
{
    return ParseError{ ParseErrorKind::InvalidInput, QStringLiteral("Invalid input for %1!").arg(keyword) };
}

template<typename IndexedCommand>
ParseResult parseIndexed(const QString &input, const QString &keyword)
{
    const QStringList parts = splitOnSpace(input);
    if (parts.size() < 2) {
        return invalidInput(keyword);
    }
    bool ok = false;
    const int index = parts.at(1).toInt(&ok);
    if (!ok) {
        return invalidInput(keyword);
    }
    IndexedCommand command;
    command.index = index;
    return Command(command);
}

ParseResult parseFind(const QString &input)
{
    const QStringList parts = splitOnSpace(input);
    if (parts.size() < 2) {
        return invalidInput(FindKeyword);
    }
    return Command(FindCommand{ parts.at(1) });
}

ParseResult parseTodo(const QString &input)
{
    const auto description = substring(input, TodoKeyword.size() + 1, input.size());
    if (!description || description->isEmpty()) {
        return invalidInput(TodoKeyword);
    }
    return Command(AddTodoCommand{ makeTodo(*description) });
}

ParseResult parseDeadline(const QString &input)
{
    const auto description = textBetween(input, DeadlineKeyword, ByMarker);
    const auto by = textAfter(input, ByMarker);
    if (!description || !by || description->isEmpty()) {
        return invalidInput(DeadlineKeyword);
    }
    return Command(AddDeadlineCommand{ makeDeadline(*description, *by) });
}

ParseResult parseEvent(const QString &input)
{
    const auto description = textBetween(input, EventKeyword, FromMarker);
    if (!description || description->isEmpty()) {
        return invalidInput(EventKeyword);
    }
    const auto from = textBetween(input, FromMarker, ToMarker);
    const auto to = textAfter(input, ToMarker);
    if (!from || !to) {
        return invalidInput(EventKeyword);
    }
    return Command(AddEventCommand{ makeEvent(*description, *from, *to) });
}

ParseResult classify(const QString &input)
{
    if (input == ByeKeyword) {
        return Command(ByeCommand{});
    }
    if (matchesIndexedShape(input, MarkKeyword)) {
        return parseIndexed<MarkCommand>(input, MarkKeyword);
    }
    if (input == ListKeyword) {
        return Command(ListCommand{});
    }
    if (matchesIndexedShape(input, DeleteKeyword)) {
        return parseIndexed<DeleteCommand>(input, DeleteKeyword);
    }
    if (hasFirstToken(input, FindKeyword)) {
        return parseFind(input);
    }
    if (matchesIndexedShape(input, UnmarkKeyword)) {
        return parseIndexed<UnmarkCommand>(input, UnmarkKeyword);
    }
    if (hasFirstToken(input, TodoKeyword)) {
        return parseTodo(input);
    }
    if (hasFirstToken(input, DeadlineKeyword)) {
        return parseDeadline(input);
    }
    if (hasFirstToken(input, EventKeyword)) {
        return parseEvent(input);
    }
    return ParseError{ ParseErrorKind::UnrecognizedCommand,
                       QStringLiteral("%1 doesn't exist as a command").arg(input) };
}
} // namespace

CommandParser::CommandParser() = default;
CommandParser::~CommandParser() = default;

ParseResult CommandParser::parse(const QString &input) const
{
    ParseResult result = classify(input);
    if (const auto *error = std::get_if<ParseError>(&result)) {
        qCDebug(lcParser) << "rejected" << input << "-" << error->message;
    } else {
        qCDebug(lcParser) << "accepted" << input;
    }
    return result;
}

bool isParseError(const ParseResult &result)
{
    return std::holds_alternative<ParseError>(result);
}

} // namespace core
} // namespace tasktracker
