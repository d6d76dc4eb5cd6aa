#include "todo/core/AppContext.hpp"

#include "todo/core/Clock.hpp"
#include "todo/core/TaskManager.hpp"
#include "todo/data/JsonTaskStore.hpp"

namespace todo {
namespace core {

AppContext::AppContext(const QString &storagePath)
    : AppContext(std::make_unique<data::JsonTaskStore>(storagePath), std::make_unique<SystemClock>())
{
}

AppContext::AppContext(std::unique_ptr<data::TaskStore> store, std::unique_ptr<Clock> clock)
    : m_store(std::move(store))
    , m_clock(std::move(clock))
    , m_taskManager(std::make_unique<TaskManager>(*m_store, *m_clock))
{
}

AppContext::~AppContext() = default;

data::TaskStore &AppContext::taskStore()
{
    return *m_store;
}

TaskManager &AppContext::taskManager()
{
    return *m_taskManager;
}

} // namespace core
} // namespace todo
