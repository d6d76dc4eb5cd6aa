#pragma once

#include <QString>
#include <memory>

namespace todo {
namespace data {
class TaskStore;
}

namespace core {

class Clock;
class TaskManager;

class AppContext
{
public:
    explicit AppContext(const QString &storagePath);
    AppContext(std::unique_ptr<data::TaskStore> store, std::unique_ptr<Clock> clock);
    ~AppContext();

    data::TaskStore &taskStore();
    TaskManager &taskManager();

private:
    std::unique_ptr<data::TaskStore> m_store;
    std::unique_ptr<Clock> m_clock;
    std::unique_ptr<TaskManager> m_taskManager;
};

} // namespace core
} // namespace todo
