#pragma once

#include <QDateTime>
#include <QString>
#include <QUuid>
#include <cstddef>
#include <optional>
#include <vector>

#include "tasktracker/core/TaskOperations.hpp"
#include "tasktracker/data/Task.hpp"

namespace tasktracker {
namespace data {
class TaskRepository;
}

namespace core {

enum class TaskError
{
    None,
    EmptyName,
    InvalidDueDate,
    InvalidIndex,
    NotFound,
    StorageFailure,
};

struct TaskResult
{
    TaskError error = TaskError::None;
    std::optional<data::TaskItem> task;

    bool ok() const { return error == TaskError::None; }
};

QString describe(TaskError error);

// User-level task operations. Every successful mutation is persisted by the
// repository before the call returns.
class TaskStore
{
public:
    explicit TaskStore(data::TaskRepository &repository);

    TaskResult addTask(const QString &name, const QString &dueText);
    std::vector<TaskListEntry> listTasks(const QDateTime &now) const;

    TaskResult removeTaskByDisplayIndex(int index);
    TaskResult removeTaskByDisplayIndex(const QString &indexText);
    TaskResult removeTaskById(const QUuid &id);

    // Does nothing unless confirmed.
    TaskError clearAllTasks(bool confirmed);

    std::size_t count() const;
    bool isEmpty() const;

    QString storageErrorString() const;

private:
    data::TaskRepository &m_repository;
};

} // namespace core
} // namespace tasktracker
