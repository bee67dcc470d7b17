#include "tasktracker/core/TaskStore.hpp"

#include "tasktracker/core/Logging.hpp"
#include "tasktracker/data/TaskRepository.hpp"

#include <QObject>

namespace tasktracker {
namespace core {

QString describe(TaskError error)
{
    switch (error) {
    case TaskError::None:
        return {};
    case TaskError::EmptyName:
        return QObject::tr("Task name must not be empty.");
    case TaskError::InvalidDueDate:
        return QObject::tr("Unrecognized date format. Use YYYY-MM-DD or YYYY-MM-DD HH:MM.");
    case TaskError::InvalidIndex:
        return QObject::tr("Invalid task number.");
    case TaskError::NotFound:
        return QObject::tr("Task not found.");
    case TaskError::StorageFailure:
    default:
        return QObject::tr("Could not save tasks.");
    }
}

TaskStore::TaskStore(data::TaskRepository &repository)
    : m_repository(repository)
{
}

TaskResult TaskStore::addTask(const QString &name, const QString &dueText)
{
    TaskResult result;
    const QString trimmedName = name.trimmed();
    if (trimmedName.isEmpty()) {
        result.error = TaskError::EmptyName;
        return result;
    }
    const auto due = parseDueDate(dueText);
    if (!due) {
        result.error = TaskError::InvalidDueDate;
        return result;
    }

    data::TaskItem task;
    task.name = trimmedName;
    task.due = *due;
    result.task = m_repository.addTask(std::move(task));
    if (!result.task) {
        result.error = TaskError::StorageFailure;
        return result;
    }
    qCDebug(lcTasks) << "Added task" << result.task->name << "due" << result.task->due;
    return result;
}

std::vector<TaskListEntry> TaskStore::listTasks(const QDateTime &now) const
{
    return core::listTasks(m_repository.fetchTasks(), now);
}

TaskResult TaskStore::removeTaskByDisplayIndex(int index)
{
    const auto sorted = sortedByDue(m_repository.fetchTasks());
    if (index < 1 || static_cast<std::size_t>(index) > sorted.size()) {
        TaskResult result;
        result.error = TaskError::InvalidIndex;
        return result;
    }
    return removeTaskById(sorted[static_cast<std::size_t>(index - 1)].id);
}

TaskResult TaskStore::removeTaskByDisplayIndex(const QString &indexText)
{
    const auto index = parseDisplayIndex(indexText);
    if (!index) {
        TaskResult result;
        result.error = TaskError::InvalidIndex;
        return result;
    }
    return removeTaskByDisplayIndex(*index);
}

TaskResult TaskStore::removeTaskById(const QUuid &id)
{
    TaskResult result;
    result.task = m_repository.findById(id);
    if (!result.task) {
        result.error = TaskError::NotFound;
        return result;
    }
    if (!m_repository.removeTask(id)) {
        result.error = TaskError::StorageFailure;
        return result;
    }
    qCDebug(lcTasks) << "Removed task" << result.task->name;
    return result;
}

TaskError TaskStore::clearAllTasks(bool confirmed)
{
    if (!confirmed) {
        return TaskError::None;
    }
    if (!m_repository.clear()) {
        return TaskError::StorageFailure;
    }
    qCDebug(lcTasks) << "Cleared all tasks";
    return TaskError::None;
}

std::size_t TaskStore::count() const
{
    return m_repository.fetchTasks().size();
}

bool TaskStore::isEmpty() const
{
    return count() == 0;
}

QString TaskStore::storageErrorString() const
{
    return m_repository.errorString();
}

} // namespace core
} // namespace tasktracker
