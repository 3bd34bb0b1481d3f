#include <QtTest/QtTest>

#include "tasktracker/core/Task.hpp"

using namespace tasktracker::core;

class TaskTest : public QObject
{
    Q_OBJECT

private slots:
    void todoDisplayString();
    void deadlineDisplayString();
    void eventDisplayString();
    void markAndUnmarkRestoresFields();
    void typeMarkers();
};

void TaskTest::todoDisplayString()
{
    Task todo = makeTodo(QStringLiteral("read book"));
    QCOMPARE(toDisplayString(todo), QStringLiteral("[T][ ] read book"));

    setTaskDone(todo, true);
    QCOMPARE(toDisplayString(todo), QStringLiteral("[T][X] read book"));
}

void TaskTest::deadlineDisplayString()
{
    const Task deadline = makeDeadline(QStringLiteral("return book"), QStringLiteral("Sunday"));
    QVERIFY(taskKind(deadline) == TaskKind::Deadline);
    QCOMPARE(toDisplayString(deadline), QStringLiteral("[D][ ] return book (by: Sunday)"));
}

void TaskTest::eventDisplayString()
{
    const Task event = makeEvent(QStringLiteral("project meeting"), QStringLiteral("Mon 2pm"), QStringLiteral("4pm"));
    QVERIFY(taskKind(event) == TaskKind::Event);
    QCOMPARE(toDisplayString(event), QStringLiteral("[E][ ] project meeting (from: Mon 2pm to: 4pm)"));
}

void TaskTest::markAndUnmarkRestoresFields()
{
    const Task original = makeEvent(QStringLiteral("%1 party"), QStringLiteral("6pm"), QStringLiteral("late"));
    Task task = original;
    QVERIFY(!isTaskDone(task));

    setTaskDone(task, true);
    QVERIFY(isTaskDone(task));
    setTaskDone(task, false);

    QVERIFY(!isTaskDone(task));
    QVERIFY(task == original);
    QCOMPARE(taskDescription(task), QStringLiteral("%1 party"));
}

void TaskTest::typeMarkers()
{
    QCOMPARE(typeMarker(TaskKind::Todo), QChar('T'));
    QCOMPARE(typeMarker(TaskKind::Deadline), QChar('D'));
    QCOMPARE(typeMarker(TaskKind::Event), QChar('E'));
}

QTEST_GUILESS_MAIN(TaskTest)
#include "TaskTest.moc"
