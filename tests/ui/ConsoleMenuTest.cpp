#include <QtTest/QtTest>

#include "tasktracker/core/TaskStore.hpp"
#include "tasktracker/data/InMemoryTaskRepository.hpp"
#include "tasktracker/ui/ConsoleMenu.hpp"

using namespace tasktracker;

namespace {

const QDateTime kNow(QDate(2026, 2, 1), QTime(12, 0));

QString runScript(core::TaskStore &store, QString script)
{
    QString output;
    QTextStream in(&script, QIODevice::ReadOnly);
    QTextStream out(&output, QIODevice::WriteOnly);
    ui::ConsoleMenu menu(store, in, out, [] { return kNow; });
    menu.run();
    out.flush();
    return output;
}

} // namespace

class ConsoleMenuTest : public QObject
{
    Q_OBJECT

private slots:
    void addAndList();
    void rejectsBadInput();
    void deletesByListedNumber();
    void clearAsksForConfirmation();
    void stopsAtEndOfInput();
};

void ConsoleMenuTest::addAndList()
{
    data::InMemoryTaskRepository repo;
    core::TaskStore store(repo);
    const QString output = runScript(store, QStringLiteral("1\nBuy milk\n2026-02-05 14:30\n"
                                                           "1\nOld task\n2026-01-01\n"
                                                           "2\n5\n"));

    QCOMPARE(store.count(), static_cast<std::size_t>(2));
    QVERIFY(output.contains(QStringLiteral("Task 'Buy milk' added, due 2026-02-05 14:30.")));
    QVERIFY(output.contains(QStringLiteral("1. Old task - due: 2026-01-01 23:59 (overdue)")));
    QVERIFY(output.contains(QStringLiteral("2. Buy milk - due: 2026-02-05 14:30\n")));
    QVERIFY(output.contains(QStringLiteral("Goodbye!")));
}

void ConsoleMenuTest::rejectsBadInput()
{
    data::InMemoryTaskRepository repo;
    core::TaskStore store(repo);
    const QString output = runScript(store, QStringLiteral("1\n   \n"
                                                           "1\nTask\nsoon\n"
                                                           "9\n2\n5\n"));

    QVERIFY(store.isEmpty());
    QVERIFY(output.contains(core::describe(core::TaskError::EmptyName)));
    QVERIFY(output.contains(core::describe(core::TaskError::InvalidDueDate)));
    QVERIFY(output.contains(QStringLiteral("Unknown option.")));
    QVERIFY(output.contains(QStringLiteral("No tasks.")));
}

void ConsoleMenuTest::deletesByListedNumber()
{
    data::InMemoryTaskRepository repo;
    core::TaskStore store(repo);
    QVERIFY(store.addTask(QStringLiteral("later"), QStringLiteral("2026-03-01")).ok());
    QVERIFY(store.addTask(QStringLiteral("sooner"), QStringLiteral("2026-02-02")).ok());

    const QString output = runScript(store, QStringLiteral("3\nx\n3\n7\n3\n1\n5\n"));

    QVERIFY(output.contains(core::describe(core::TaskError::InvalidIndex)));
    QVERIFY(output.contains(QStringLiteral("Task 'sooner' deleted.")));
    const auto remaining = repo.fetchTasks();
    QCOMPARE(remaining.size(), static_cast<size_t>(1));
    QCOMPARE(remaining.front().name, QStringLiteral("later"));
}

void ConsoleMenuTest::clearAsksForConfirmation()
{
    data::InMemoryTaskRepository repo;
    core::TaskStore store(repo);
    QVERIFY(store.addTask(QStringLiteral("a"), QStringLiteral("2026-03-01")).ok());

    QString output = runScript(store, QStringLiteral("4\nn\n5\n"));
    QVERIFY(output.contains(QStringLiteral("Cancelled.")));
    QCOMPARE(store.count(), static_cast<std::size_t>(1));

    output = runScript(store, QStringLiteral("4\nY\n5\n"));
    QVERIFY(output.contains(QStringLiteral("All tasks deleted.")));
    QVERIFY(store.isEmpty());

    // An empty store still asks before clearing.
    output = runScript(store, QStringLiteral("4\ny\n5\n"));
    QCOMPARE(output.count(QStringLiteral("Delete all tasks? (y/N): ")), 1);
    QVERIFY(output.contains(QStringLiteral("All tasks deleted.")));
    QVERIFY(!output.contains(QStringLiteral("No tasks to delete.")));
}

void ConsoleMenuTest::stopsAtEndOfInput()
{
    data::InMemoryTaskRepository repo;
    core::TaskStore store(repo);
    const QString output = runScript(store, QStringLiteral("1\nHalf entered\n"));

    QVERIFY(store.isEmpty());
    QVERIFY(!output.contains(QStringLiteral("Goodbye!")));
    QCOMPARE(runScript(store, QString()).count(QStringLiteral("1. Add task")), 1);
}

QTEST_GUILESS_MAIN(ConsoleMenuTest)
#include "ConsoleMenuTest.moc"
