#include "tasktracker/ui/ConsoleMenu.hpp"

#include "tasktracker/core/TaskStore.hpp"

#include <QObject>

namespace tasktracker {
namespace ui {

namespace {
constexpr auto DISPLAY_FORMAT = "yyyy-MM-dd HH:mm";
const QString SEPARATOR = QStringLiteral("-------------------------------------------------");
} // namespace

ConsoleMenu::ConsoleMenu(core::TaskStore &store, QTextStream &in, QTextStream &out, Clock clock)
    : m_store(store)
    , m_in(in)
    , m_out(out)
    , m_clock(std::move(clock))
{
}

int ConsoleMenu::run()
{
    while (true) {
        showMenu();
        const auto choice = prompt(QObject::tr("Choose an option: "));
        if (!choice) {
            m_out << '\n';
            break;
        }
        const QString selected = choice->trimmed();
        if (selected == QLatin1String("1")) {
            addTask();
        } else if (selected == QLatin1String("2")) {
            listTasks();
        } else if (selected == QLatin1String("3")) {
            removeTask();
        } else if (selected == QLatin1String("4")) {
            clearTasks();
        } else if (selected == QLatin1String("5")) {
            m_out << QObject::tr("Goodbye!") << '\n';
            break;
        } else {
            m_out << QObject::tr("Unknown option. Enter a number between 1 and 5.") << '\n';
        }
    }
    m_out.flush();
    return 0;
}

void ConsoleMenu::showMenu()
{
    m_out << QObject::tr("Task Tracker (sorted by due date)") << '\n'
          << QObject::tr("1. Add task") << '\n'
          << QObject::tr("2. List tasks") << '\n'
          << QObject::tr("3. Delete task") << '\n'
          << QObject::tr("4. Delete all tasks") << '\n'
          << QObject::tr("5. Exit") << '\n';
}

void ConsoleMenu::addTask()
{
    const auto name = prompt(QObject::tr("Task name: "));
    if (!name) {
        return;
    }
    if (name->trimmed().isEmpty()) {
        reportFailure(core::TaskError::EmptyName);
        return;
    }
    const auto due = prompt(QObject::tr("Due (e.g. 2026-02-05 14:30 or 2026-02-05): "));
    if (!due) {
        return;
    }

    const auto result = m_store.addTask(*name, *due);
    if (!result.ok()) {
        reportFailure(result.error);
        return;
    }
    m_out << QObject::tr("Task '%1' added, due %2.")
                 .arg(result.task->name, result.task->due.toString(QLatin1String(DISPLAY_FORMAT)))
          << '\n';
}

void ConsoleMenu::listTasks()
{
    const auto entries = m_store.listTasks(m_clock());
    if (entries.empty()) {
        m_out << QObject::tr("No tasks.") << '\n';
        return;
    }
    m_out << '\n' << QObject::tr("Tasks (sorted by due date):") << '\n' << SEPARATOR << '\n';
    for (const auto &entry : entries) {
        m_out << entry.displayIndex << ". " << entry.task.name << " - "
              << QObject::tr("due: %1").arg(entry.task.due.toString(QLatin1String(DISPLAY_FORMAT)));
        if (entry.overdue) {
            m_out << ' ' << QObject::tr("(overdue)");
        }
        m_out << '\n';
    }
    m_out << SEPARATOR << "\n\n";
}

void ConsoleMenu::removeTask()
{
    if (m_store.isEmpty()) {
        m_out << QObject::tr("No tasks to delete.") << '\n';
        return;
    }
    listTasks();
    const auto input = prompt(QObject::tr("Number of the task to delete: "));
    if (!input) {
        return;
    }
    const auto result = m_store.removeTaskByDisplayIndex(*input);
    if (!result.ok()) {
        reportFailure(result.error);
        return;
    }
    m_out << QObject::tr("Task '%1' deleted.").arg(result.task->name) << '\n';
}

void ConsoleMenu::clearTasks()
{
    const auto answer = prompt(QObject::tr("Delete all tasks? (y/N): "));
    const bool confirmed = answer && answer->trimmed().compare(QLatin1String("y"), Qt::CaseInsensitive) == 0;
    if (!confirmed) {
        m_out << QObject::tr("Cancelled.") << '\n';
        return;
    }
    const auto error = m_store.clearAllTasks(confirmed);
    if (error != core::TaskError::None) {
        reportFailure(error);
        return;
    }
    m_out << QObject::tr("All tasks deleted.") << '\n';
}

std::optional<QString> ConsoleMenu::prompt(const QString &label)
{
    m_out << label;
    m_out.flush();
    QString line;
    if (!m_in.readLineInto(&line)) {
        return std::nullopt;
    }
    return line;
}

void ConsoleMenu::reportFailure(core::TaskError error)
{
    m_out << core::describe(error);
    if (error == core::TaskError::StorageFailure) {
        m_out << ' ' << m_store.storageErrorString();
    }
    m_out << '\n';
}

} // namespace ui
} // namespace tasktracker
