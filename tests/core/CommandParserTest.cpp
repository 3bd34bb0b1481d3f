#include <QtTest/QtTest>

#include "tasktracker/core/CommandParser.hpp"

using namespace tasktracker::core;

namespace {

template<typename T>
const T *commandAs(const ParseResult &result)
{
    const auto *command = std::get_if<Command>(&result);
    return command ? std::get_if<T>(command) : nullptr;
}

bool failsWith(const ParseResult &result, ParseErrorKind kind)
{
    const auto *error = std::get_if<ParseError>(&result);
    return error && error->kind == kind;
}

QString errorMessage(const ParseResult &result)
{
    const auto *error = std::get_if<ParseError>(&result);
    return error ? error->message : QString();
}

} // namespace

class CommandParserTest : public QObject
{
    Q_OBJECT

private slots:
    void byeAndListNeedExactText();
    void acceptsEveryIndexUpToHundred();
    void rejectsMalformedIndices();
    void findTakesSecondToken();
    void findWithoutKeywordIsInvalid();
    void todoTakesTextAfterKeyword();
    void todoWithoutDescriptionIsInvalid();
    void deadlineSplitsOnBy();
    void deadlineWithoutMarkerIsInvalid();
    void eventSplitsOnFromAndTo();
    void eventWithMissingOrMisplacedMarkersIsInvalid();
    void skipsExactlyOneCharacterAfterKeyword();
    void unknownInputIsUnrecognized();
    void firstMatchingShapeWins();
};

void CommandParserTest::byeAndListNeedExactText()
{
    CommandParser parser;
    QVERIFY(commandAs<ByeCommand>(parser.parse(QStringLiteral("bye"))));
    QVERIFY(commandAs<ListCommand>(parser.parse(QStringLiteral("list"))));

    QVERIFY(failsWith(parser.parse(QStringLiteral("bye ")), ParseErrorKind::UnrecognizedCommand));
    QVERIFY(failsWith(parser.parse(QStringLiteral("List")), ParseErrorKind::UnrecognizedCommand));
    QVERIFY(failsWith(parser.parse(QStringLiteral("list all")), ParseErrorKind::UnrecognizedCommand));
}

void CommandParserTest::acceptsEveryIndexUpToHundred()
{
    CommandParser parser;
    for (int n = 1; n <= 100; ++n) {
        const QString number = QString::number(n);

        const auto markResult = parser.parse(QStringLiteral("mark ") + number);
        const auto *mark = commandAs<MarkCommand>(markResult);
        QVERIFY2(mark, qPrintable(number));
        QCOMPARE(mark->index, n);

        const auto unmarkResult = parser.parse(QStringLiteral("unmark ") + number);
        const auto *unmark = commandAs<UnmarkCommand>(unmarkResult);
        QVERIFY2(unmark, qPrintable(number));
        QCOMPARE(unmark->index, n);

        const auto removeResult = parser.parse(QStringLiteral("delete ") + number);
        const auto *remove = commandAs<DeleteCommand>(removeResult);
        QVERIFY2(remove, qPrintable(number));
        QCOMPARE(remove->index, n);
    }
}

void CommandParserTest::rejectsMalformedIndices()
{
    CommandParser parser;
    const QStringList inputs = {
        QStringLiteral("mark 0"),     QStringLiteral("mark 101"),   QStringLiteral("mark abc"),
        QStringLiteral("mark"),       QStringLiteral("mark 05"),    QStringLiteral("mark 1 2"),
        QStringLiteral("mark  3"),    QStringLiteral("unmark 0"),   QStringLiteral("unmark 1000"),
        QStringLiteral("delete -1"),  QStringLiteral("delete"),     QStringLiteral("delete 12x"),
    };
    for (const QString &input : inputs) {
        QVERIFY2(isParseError(parser.parse(input)), qPrintable(input));
    }
}

void CommandParserTest::findTakesSecondToken()
{
    CommandParser parser;
    const auto findResult = parser.parse(QStringLiteral("find book"));
    const auto *find = commandAs<FindCommand>(findResult);
    QVERIFY(find);
    QCOMPARE(find->keyword, QStringLiteral("book"));

    const auto extraResult = parser.parse(QStringLiteral("find book shelf"));
    const auto *extra = commandAs<FindCommand>(extraResult);
    QVERIFY(extra);
    QCOMPARE(extra->keyword, QStringLiteral("book"));
}

void CommandParserTest::findWithoutKeywordIsInvalid()
{
    CommandParser parser;
    const auto result = parser.parse(QStringLiteral("find"));
    QVERIFY(failsWith(result, ParseErrorKind::InvalidInput));
    QCOMPARE(errorMessage(result), QStringLiteral("Invalid input for find!"));

    QVERIFY(failsWith(parser.parse(QStringLiteral("find ")), ParseErrorKind::InvalidInput));
}

void CommandParserTest::todoTakesTextAfterKeyword()
{
    CommandParser parser;
    const auto todoResult = parser.parse(QStringLiteral("todo read book"));
    const auto *todo = commandAs<AddTodoCommand>(todoResult);
    QVERIFY(todo);
    QVERIFY(std::holds_alternative<TodoTask>(todo->task));
    QCOMPARE(taskDescription(todo->task), QStringLiteral("read book"));
    QVERIFY(!isTaskDone(todo->task));
}

void CommandParserTest::todoWithoutDescriptionIsInvalid()
{
    CommandParser parser;
    const auto result = parser.parse(QStringLiteral("todo"));
    QVERIFY(failsWith(result, ParseErrorKind::InvalidInput));
    QCOMPARE(errorMessage(result), QStringLiteral("Invalid input for todo!"));

    QVERIFY(failsWith(parser.parse(QStringLiteral("todo ")), ParseErrorKind::InvalidInput));
}

void CommandParserTest::deadlineSplitsOnBy()
{
    CommandParser parser;
    const auto deadlineResult = parser.parse(QStringLiteral("deadline return book /by Sunday"));
    const auto *deadline = commandAs<AddDeadlineCommand>(deadlineResult);
    QVERIFY(deadline);
    const auto *task = std::get_if<DeadlineTask>(&deadline->task);
    QVERIFY(task);
    QCOMPARE(task->description, QStringLiteral("return book"));
    QCOMPARE(task->by, QStringLiteral("Sunday"));
}

void CommandParserTest::deadlineWithoutMarkerIsInvalid()
{
    CommandParser parser;
    const auto result = parser.parse(QStringLiteral("deadline return book"));
    QVERIFY(failsWith(result, ParseErrorKind::InvalidInput));
    QCOMPARE(errorMessage(result), QStringLiteral("Invalid input for deadline!"));

    QVERIFY(failsWith(parser.parse(QStringLiteral("deadline")), ParseErrorKind::InvalidInput));
    QVERIFY(failsWith(parser.parse(QStringLiteral("deadline /by Sunday")), ParseErrorKind::InvalidInput));
    QVERIFY(failsWith(parser.parse(QStringLiteral("deadline return book /by")), ParseErrorKind::InvalidInput));
}

void CommandParserTest::eventSplitsOnFromAndTo()
{
    CommandParser parser;
    const auto eventResult = parser.parse(QStringLiteral("event project meeting /from Mon 2pm /to 4pm"));
    const auto *event = commandAs<AddEventCommand>(eventResult);
    QVERIFY(event);
    const auto *task = std::get_if<EventTask>(&event->task);
    QVERIFY(task);
    QCOMPARE(task->description, QStringLiteral("project meeting"));
    QCOMPARE(task->from, QStringLiteral("Mon 2pm"));
    QCOMPARE(task->to, QStringLiteral("4pm"));
}

void CommandParserTest::eventWithMissingOrMisplacedMarkersIsInvalid()
{
    CommandParser parser;
    const QStringList inputs = {
        QStringLiteral("event project meeting"),
        QStringLiteral("event project meeting /from Mon 2pm"),
        QStringLiteral("event project meeting /to 4pm"),
        QStringLiteral("event project meeting /to 4pm /from Mon 2pm"),
        QStringLiteral("event /from Mon /to Tue"),
    };
    for (const QString &input : inputs) {
        const auto result = parser.parse(input);
        QVERIFY2(failsWith(result, ParseErrorKind::InvalidInput), qPrintable(input));
        QCOMPARE(errorMessage(result), QStringLiteral("Invalid input for event!"));
    }
}

void CommandParserTest::skipsExactlyOneCharacterAfterKeyword()
{
    CommandParser parser;
    const auto todoResult = parser.parse(QStringLiteral("todo  indented"));
    const auto *todo = commandAs<AddTodoCommand>(todoResult);
    QVERIFY(todo);
    QCOMPARE(taskDescription(todo->task), QStringLiteral(" indented"));

    const auto deadlineResult = parser.parse(QStringLiteral("deadline  essay /by  noon"));
    const auto *deadline = commandAs<AddDeadlineCommand>(deadlineResult);
    QVERIFY(deadline);
    const auto *task = std::get_if<DeadlineTask>(&deadline->task);
    QVERIFY(task);
    QCOMPARE(task->description, QStringLiteral(" essay"));
    QCOMPARE(task->by, QStringLiteral(" noon"));
}

void CommandParserTest::unknownInputIsUnrecognized()
{
    CommandParser parser;
    const auto result = parser.parse(QStringLiteral("dance"));
    QVERIFY(failsWith(result, ParseErrorKind::UnrecognizedCommand));
    QCOMPARE(errorMessage(result), QStringLiteral("dance doesn't exist as a command"));

    QVERIFY(failsWith(parser.parse(QString()), ParseErrorKind::UnrecognizedCommand));
    QVERIFY(failsWith(parser.parse(QStringLiteral("deadlinefoo /by x")), ParseErrorKind::UnrecognizedCommand));
    QVERIFY(failsWith(parser.parse(QStringLiteral(" todo leading space")), ParseErrorKind::UnrecognizedCommand));
}

void CommandParserTest::firstMatchingShapeWins()
{
    CommandParser parser;
    const auto findResult = parser.parse(QStringLiteral("find mark 3"));
    const auto *find = commandAs<FindCommand>(findResult);
    QVERIFY(find);
    QCOMPARE(find->keyword, QStringLiteral("mark"));

    const auto todoResult = parser.parse(QStringLiteral("todo submit /by Friday"));
    const auto *todo = commandAs<AddTodoCommand>(todoResult);
    QVERIFY(todo);
    QCOMPARE(taskDescription(todo->task), QStringLiteral("submit /by Friday"));
}

QTEST_GUILESS_MAIN(CommandParserTest)
#include "CommandParserTest.moc"
