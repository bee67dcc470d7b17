#pragma once

#include "tasktracker/data/TaskRepository.hpp"
#include "tasktracker/data/FileTaskStorage.hpp"

#include <memory>

namespace tasktracker {
namespace data {

// Keeps the collection in memory and writes it back after every mutation.
// The in-memory state only changes once the write succeeded.
class FileTaskRepository : public TaskRepository
{
public:
    explicit FileTaskRepository(std::shared_ptr<FileTaskStorage> storage);
    ~FileTaskRepository() override = default;

    StorageError load();

    std::vector<TaskItem> fetchTasks() const override;
    std::optional<TaskItem> findById(const QUuid &id) const override;
    std::optional<TaskItem> addTask(TaskItem task) override;
    bool removeTask(const QUuid &id) override;
    bool clear() override;

    StorageError lastError() const override;
    QString errorString() const override;

private:
    bool commit(std::vector<TaskItem> tasks);

    std::shared_ptr<FileTaskStorage> m_storage;
    std::vector<TaskItem> m_tasks;
};

} // namespace data
} // namespace tasktracker
