#pragma once

#include "tasktracker/data/TaskRepository.hpp"

namespace tasktracker {
namespace data {

class InMemoryTaskRepository : public TaskRepository
{
public:
    InMemoryTaskRepository();
    ~InMemoryTaskRepository() override;

    std::vector<TaskItem> fetchTasks() const override;
    std::optional<TaskItem> findById(const QUuid &id) const override;
    std::optional<TaskItem> addTask(TaskItem task) override;
    bool removeTask(const QUuid &id) override;
    bool clear() override;

    StorageError lastError() const override;
    QString errorString() const override;

private:
    std::vector<TaskItem> m_items;
};

} // namespace data
} // namespace tasktracker
