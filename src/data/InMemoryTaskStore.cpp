#include "todo/data/InMemoryTaskStore.hpp"

namespace todo {
namespace data {

InMemoryTaskStore::InMemoryTaskStore() = default;

InMemoryTaskStore::InMemoryTaskStore(TaskList initial)
    : m_tasks(std::move(initial))
{
}

InMemoryTaskStore::~InMemoryTaskStore() = default;

TaskList InMemoryTaskStore::load() const
{
    return m_tasks;
}

bool InMemoryTaskStore::save(const TaskList &tasks, QString *errorString)
{
    ++m_saveCount;
    if (m_failSaves) {
        if (errorString) {
            *errorString = QStringLiteral("Simulated write failure");
        }
        return false;
    }
    m_tasks = tasks;
    return true;
}

QString InMemoryTaskStore::location() const
{
    return QStringLiteral("<memory>");
}

void InMemoryTaskStore::setFailSaves(bool fail)
{
    m_failSaves = fail;
}

const TaskList &InMemoryTaskStore::snapshot() const
{
    return m_tasks;
}

int InMemoryTaskStore::saveCount() const
{
    return m_saveCount;
}

} // namespace data
} // namespace todo
