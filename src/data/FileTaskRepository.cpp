#include "tasktracker/data/FileTaskRepository.hpp"

#include "tasktracker/core/Logging.hpp"

#include <algorithm>

namespace tasktracker {
namespace data {

FileTaskRepository::FileTaskRepository(std::shared_ptr<FileTaskStorage> storage)
    : m_storage(std::move(storage))
{
}

StorageError FileTaskRepository::load()
{
    m_tasks.clear();
    if (!m_storage) {
        return StorageError::NoError;
    }
    auto loaded = m_storage->load();
    if (!loaded) {
        return m_storage->lastError();
    }
    m_tasks = std::move(*loaded);
    qCDebug(lcStorage) << "Loaded" << m_tasks.size() << "tasks from" << m_storage->filePath();
    return StorageError::NoError;
}

std::vector<TaskItem> FileTaskRepository::fetchTasks() const
{
    return m_tasks;
}

std::optional<TaskItem> FileTaskRepository::findById(const QUuid &id) const
{
    const auto it = std::find_if(m_tasks.cbegin(), m_tasks.cend(), [&id](const TaskItem &item) {
        return item.id == id;
    });
    if (it != m_tasks.cend()) {
        return *it;
    }
    return std::nullopt;
}

std::optional<TaskItem> FileTaskRepository::addTask(TaskItem task)
{
    if (task.id.isNull()) {
        task.id = QUuid::createUuid();
    }
    auto next = m_tasks;
    next.push_back(task);
    if (!commit(std::move(next))) {
        return std::nullopt;
    }
    return task;
}

bool FileTaskRepository::removeTask(const QUuid &id)
{
    auto next = m_tasks;
    const auto it = std::find_if(next.begin(), next.end(), [&id](const TaskItem &item) {
        return item.id == id;
    });
    if (it == next.end()) {
        return false;
    }
    next.erase(it);
    return commit(std::move(next));
}

bool FileTaskRepository::clear()
{
    return commit({});
}

StorageError FileTaskRepository::lastError() const
{
    if (!m_storage) {
        return StorageError::NoError;
    }
    return m_storage->lastError();
}

QString FileTaskRepository::errorString() const
{
    if (!m_storage) {
        return {};
    }
    return m_storage->errorString();
}

bool FileTaskRepository::commit(std::vector<TaskItem> tasks)
{
    if (m_storage && !m_storage->save(tasks)) {
        return false;
    }
    m_tasks = std::move(tasks);
    return true;
}

} // namespace data
} // namespace tasktracker
