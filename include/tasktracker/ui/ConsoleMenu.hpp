#pragma once

#include <QDateTime>
#include <QString>
#include <QTextStream>
#include <functional>
#include <optional>

namespace tasktracker {
namespace core {
class TaskStore;
enum class TaskError;
}

namespace ui {

// Numbered menu driving a TaskStore over text streams. Ends on "5" or end of input.
class ConsoleMenu
{
public:
    using Clock = std::function<QDateTime()>;

    ConsoleMenu(core::TaskStore &store, QTextStream &in, QTextStream &out,
                Clock clock = &QDateTime::currentDateTime);

    int run();

private:
    void showMenu();
    void addTask();
    void listTasks();
    void removeTask();
    void clearTasks();

    std::optional<QString> prompt(const QString &label);
    void reportFailure(core::TaskError error);

    core::TaskStore &m_store;
    QTextStream &m_in;
    QTextStream &m_out;
    Clock m_clock;
};

} // namespace ui
} // namespace tasktracker
