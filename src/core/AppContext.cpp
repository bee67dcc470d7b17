#include "tasktracker/core/AppContext.hpp"

#include "tasktracker/core/Logging.hpp"
#include "tasktracker/core/TaskStore.hpp"
#include "tasktracker/data/FileTaskRepository.hpp"
#include "tasktracker/data/FileTaskStorage.hpp"

namespace tasktracker {
namespace core {

AppContext::AppContext(AppConfig config)
    : m_config(std::move(config))
    , m_storage(std::make_shared<data::FileTaskStorage>(m_config.tasksFilePath))
    , m_repository(std::make_unique<data::FileTaskRepository>(m_storage))
    , m_taskStore(std::make_unique<TaskStore>(*m_repository))
{
}

AppContext::~AppContext() = default;

data::StorageError AppContext::load()
{
    qCDebug(lcApp) << "Using task file" << m_config.tasksFilePath;
    return m_repository->load();
}

QString AppContext::errorString() const
{
    return m_repository->errorString();
}

const AppConfig &AppContext::config() const
{
    return m_config;
}

TaskStore &AppContext::taskStore()
{
    return *m_taskStore;
}

} // namespace core
} // namespace tasktracker
