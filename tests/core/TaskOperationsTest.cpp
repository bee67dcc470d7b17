#include <QtTest/QtTest>

#include "tasktracker/core/TaskOperations.hpp"

using namespace tasktracker;

namespace {

data::TaskItem makeTask(const QString &name, const QDateTime &due)
{
    data::TaskItem task;
    task.name = name;
    task.due = due;
    return task;
}

} // namespace

class TaskOperationsTest : public QObject
{
    Q_OBJECT

private slots:
    void parsesDateAndTime();
    void dateOnlyIsEndOfDay();
    void rejectsUnknownFormats();
    void listIsSortedAndStable();
    void overdueBoundary();
    void parsesDisplayIndex();
};

void TaskOperationsTest::parsesDateAndTime()
{
    const auto due = core::parseDueDate(QStringLiteral("2026-02-05 14:30"));
    QVERIFY(due.has_value());
    QCOMPARE(*due, QDateTime(QDate(2026, 2, 5), QTime(14, 30)));

    const auto padded = core::parseDueDate(QStringLiteral("  2026-02-05 14:30 "));
    QVERIFY(padded.has_value());
    QCOMPARE(*padded, QDateTime(QDate(2026, 2, 5), QTime(14, 30)));
}

void TaskOperationsTest::dateOnlyIsEndOfDay()
{
    const auto due = core::parseDueDate(QStringLiteral("2026-02-05"));
    QVERIFY(due.has_value());
    QCOMPARE(*due, QDateTime(QDate(2026, 2, 5), QTime(23, 59)));
}

void TaskOperationsTest::rejectsUnknownFormats()
{
    QVERIFY(!core::parseDueDate(QStringLiteral("not-a-date")).has_value());
    QVERIFY(!core::parseDueDate(QString()).has_value());
    QVERIFY(!core::parseDueDate(QStringLiteral("05/02/2026")).has_value());
    QVERIFY(!core::parseDueDate(QStringLiteral("2026-02-30")).has_value());
    QVERIFY(!core::parseDueDate(QStringLiteral("2026-02-05 25:00")).has_value());
    QVERIFY(!core::parseDueDate(QStringLiteral("2026-02-05T14:30")).has_value());
}

void TaskOperationsTest::listIsSortedAndStable()
{
    const QDateTime early(QDate(2026, 1, 1), QTime(9, 0));
    const QDateTime late(QDate(2026, 3, 1), QTime(9, 0));
    const std::vector<data::TaskItem> tasks{
        makeTask(QStringLiteral("late"), late),
        makeTask(QStringLiteral("tie-first"), early),
        makeTask(QStringLiteral("tie-second"), early),
    };

    const auto entries = core::listTasks(tasks, QDateTime(QDate(2025, 1, 1), QTime(0, 0)));
    QCOMPARE(entries.size(), static_cast<size_t>(3));
    QCOMPARE(entries[0].task.name, QStringLiteral("tie-first"));
    QCOMPARE(entries[1].task.name, QStringLiteral("tie-second"));
    QCOMPARE(entries[2].task.name, QStringLiteral("late"));
    for (size_t i = 0; i < entries.size(); ++i) {
        QCOMPARE(entries[i].displayIndex, static_cast<int>(i + 1));
        QVERIFY(!entries[i].overdue);
    }

    // The input collection keeps its order.
    QCOMPARE(tasks.front().name, QStringLiteral("late"));
}

void TaskOperationsTest::overdueBoundary()
{
    const QDateTime now(QDate(2026, 2, 5), QTime(14, 30));
    const std::vector<data::TaskItem> tasks{
        makeTask(QStringLiteral("past"), now.addSecs(-60)),
        makeTask(QStringLiteral("exact"), now),
        makeTask(QStringLiteral("future"), now.addSecs(60)),
    };

    const auto entries = core::listTasks(tasks, now);
    QCOMPARE(entries.size(), static_cast<size_t>(3));
    QVERIFY(entries[0].overdue);
    QVERIFY(!entries[1].overdue);
    QVERIFY(!entries[2].overdue);
}

void TaskOperationsTest::parsesDisplayIndex()
{
    QVERIFY(core::parseDisplayIndex(QStringLiteral(" 3 ")) == std::optional<int>(3));
    QVERIFY(!core::parseDisplayIndex(QStringLiteral("three")).has_value());
    QVERIFY(!core::parseDisplayIndex(QString()).has_value());
}

QTEST_GUILESS_MAIN(TaskOperationsTest)
#include "TaskOperationsTest.moc"
