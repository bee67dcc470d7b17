#pragma once

#include <optional>
#include <vector>

#include <QString>

#include "tasktracker/data/StorageError.hpp"
#include "tasktracker/data/Task.hpp"

namespace tasktracker {
namespace data {

// Owns the task collection. fetchTasks() preserves insertion order.
class TaskRepository
{
public:
    virtual ~TaskRepository() = default;

    virtual std::vector<TaskItem> fetchTasks() const = 0;
    virtual std::optional<TaskItem> findById(const QUuid &id) const = 0;
    virtual std::optional<TaskItem> addTask(TaskItem task) = 0;
    virtual bool removeTask(const QUuid &id) = 0;
    virtual bool clear() = 0;

    virtual StorageError lastError() const = 0;
    virtual QString errorString() const = 0;
};

} // namespace data
} // namespace tasktracker
