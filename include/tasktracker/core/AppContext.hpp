#pragma once

#include <QString>
#include <memory>

#include "tasktracker/core/AppConfig.hpp"
#include "tasktracker/data/StorageError.hpp"

namespace tasktracker {
namespace data {
class FileTaskStorage;
class FileTaskRepository;
}

namespace core {

class TaskStore;

class AppContext
{
public:
    explicit AppContext(AppConfig config);
    ~AppContext();

    data::StorageError load();
    QString errorString() const;

    const AppConfig &config() const;
    TaskStore &taskStore();

private:
    AppConfig m_config;
    std::shared_ptr<data::FileTaskStorage> m_storage;
    std::unique_ptr<data::FileTaskRepository> m_repository;
    std::unique_ptr<TaskStore> m_taskStore;
};

} // namespace core
} // namespace tasktracker
