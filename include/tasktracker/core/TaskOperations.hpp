#pragma once

#include <QDateTime>
#include <QString>
#include <optional>
#include <vector>

#include "tasktracker/data/Task.hpp"

namespace tasktracker {
namespace core {

struct TaskListEntry
{
    int displayIndex = 0; // 1-based position in the due-sorted view
    data::TaskItem task;
    bool overdue = false;
};

// Accepts "yyyy-MM-dd HH:mm" or "yyyy-MM-dd" (due at 23:59 that day).
std::optional<QDateTime> parseDueDate(const QString &text);

// Stable sort by due date; equal due dates keep their input order.
std::vector<data::TaskItem> sortedByDue(std::vector<data::TaskItem> tasks);

std::vector<TaskListEntry> listTasks(const std::vector<data::TaskItem> &tasks, const QDateTime &now);

std::optional<int> parseDisplayIndex(const QString &text);

} // namespace core
} // namespace tasktracker
