#include "tasktracker/core/TaskOperations.hpp"

#include <QDate>
#include <QTime>
#include <algorithm>

namespace tasktracker {
namespace core {

namespace {
constexpr auto DATE_TIME_FORMAT = "yyyy-MM-dd HH:mm";
constexpr auto DATE_FORMAT = "yyyy-MM-dd";
} // namespace

std::optional<QDateTime> parseDueDate(const QString &text)
{
    const QString input = text.trimmed();
    if (input.isEmpty()) {
        return std::nullopt;
    }

    const QDateTime dateTime = QDateTime::fromString(input, QLatin1String(DATE_TIME_FORMAT));
    if (dateTime.isValid()) {
        return dateTime;
    }

    const QDate date = QDate::fromString(input, QLatin1String(DATE_FORMAT));
    if (date.isValid()) {
        return QDateTime(date, QTime(23, 59));
    }
    return std::nullopt;
}

std::vector<data::TaskItem> sortedByDue(std::vector<data::TaskItem> tasks)
{
    std::stable_sort(tasks.begin(), tasks.end(), [](const data::TaskItem &lhs, const data::TaskItem &rhs) {
        return lhs.due < rhs.due;
    });
    return tasks;
}

std::vector<TaskListEntry> listTasks(const std::vector<data::TaskItem> &tasks, const QDateTime &now)
{
    const auto sorted = sortedByDue(tasks);
    std::vector<TaskListEntry> entries;
    entries.reserve(sorted.size());
    int index = 1;
    for (const auto &task : sorted) {
        TaskListEntry entry;
        entry.displayIndex = index++;
        entry.task = task;
        entry.overdue = task.due < now;
        entries.push_back(std::move(entry));
    }
    return entries;
}

std::optional<int> parseDisplayIndex(const QString &text)
{
    bool ok = false;
    const int value = text.trimmed().toInt(&ok);
    if (!ok) {
        return std::nullopt;
    }
    return value;
}

} // namespace core
} // namespace tasktracker
