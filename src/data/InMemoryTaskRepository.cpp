#include "tasktracker/data/InMemoryTaskRepository.hpp"

#include <algorithm>

namespace tasktracker {
namespace data {

InMemoryTaskRepository::InMemoryTaskRepository() = default;
InMemoryTaskRepository::~InMemoryTaskRepository() = default;

std::vector<TaskItem> InMemoryTaskRepository::fetchTasks() const
{
    return m_items;
}

std::optional<TaskItem> InMemoryTaskRepository::findById(const QUuid &id) const
{
    const auto it = std::find_if(m_items.cbegin(), m_items.cend(), [&id](const TaskItem &item) {
        return item.id == id;
    });
    if (it != m_items.cend()) {
        return *it;
    }
    return std::nullopt;
}

std::optional<TaskItem> InMemoryTaskRepository::addTask(TaskItem task)
{
    if (task.id.isNull()) {
        task.id = QUuid::createUuid();
    }
    m_items.push_back(task);
    return task;
}

bool InMemoryTaskRepository::removeTask(const QUuid &id)
{
    const auto it = std::find_if(m_items.begin(), m_items.end(), [&id](const TaskItem &item) {
        return item.id == id;
    });
    if (it == m_items.end()) {
        return false;
    }
    m_items.erase(it);
    return true;
}

bool InMemoryTaskRepository::clear()
{
    m_items.clear();
    return true;
}

StorageError InMemoryTaskRepository::lastError() const
{
    return StorageError::NoError;
}

QString InMemoryTaskRepository::errorString() const
{
    return {};
}

} // namespace data
} // namespace tasktracker
