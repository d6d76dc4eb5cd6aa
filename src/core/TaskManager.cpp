#include "todo/core/TaskManager.hpp"

#include <QTime>
#include <algorithm>
#include <iterator>
#include <limits>

#include "todo/core/Clock.hpp"
#include "todo/data/TaskStore.hpp"

namespace todo {
namespace core {

namespace {
// The file format keeps minutes only; truncate so memory and disk agree.
QDateTime truncateToMinute(const QDateTime &dt)
{
    const QTime time = dt.time();
    return dt.addMSecs(-(time.second() * 1000 + time.msec()));
}
} // namespace

TaskManager::TaskManager(data::TaskStore &store, const Clock &clock)
    : m_store(store)
    , m_clock(clock)
    , m_tasks(store.load())
{
}

TaskManager::~TaskManager() = default;

TaskResult TaskManager::add(const QString &description)
{
    TaskResult result;
    const QString text = description.trimmed();
    if (text.isEmpty()) {
        result.error = TaskError::EmptyDescription;
        return result;
    }

    const auto id = nextId();
    if (!id) {
        result.error = TaskError::IdsExhausted;
        return result;
    }

    data::Task task;
    task.id = *id;
    task.description = text;
    task.completed = false;
    task.createdAt = truncateToMinute(m_clock.now());
    m_tasks.push_back(task);

    result.task = task;
    if (!persist(&result.errorString)) {
        result.error = TaskError::SaveFailed;
    }
    return result;
}

const data::TaskList &TaskManager::list() const
{
    return m_tasks;
}

TaskResult TaskManager::complete(int id)
{
    TaskResult result;
    auto it = findTask(id);
    if (it == m_tasks.end()) {
        result.error = TaskError::NotFound;
        return result;
    }

    it->completed = true;
    result.task = *it;
    if (!persist(&result.errorString)) {
        result.error = TaskError::SaveFailed;
    }
    return result;
}

TaskResult TaskManager::remove(int id)
{
    TaskResult result;
    auto it = findTask(id);
    if (it == m_tasks.end()) {
        result.error = TaskError::NotFound;
        return result;
    }

    result.task = *it;
    m_tasks.erase(it);
    if (!persist(&result.errorString)) {
        result.error = TaskError::SaveFailed;
    }
    return result;
}

ClearResult TaskManager::clear()
{
    ClearResult result;
    const auto firstCompleted = std::stable_partition(m_tasks.begin(), m_tasks.end(), [](const data::Task &task) {
        return !task.completed;
    });
    result.removed = static_cast<int>(std::distance(firstCompleted, m_tasks.end()));
    m_tasks.erase(firstCompleted, m_tasks.end());

    // Saved even when nothing was removed.
    if (!persist(&result.errorString)) {
        result.error = TaskError::SaveFailed;
    }
    return result;
}

std::optional<data::Task> TaskManager::find(int id) const
{
    const auto it = std::find_if(m_tasks.cbegin(), m_tasks.cend(), [id](const data::Task &task) {
        return task.id == id;
    });
    if (it == m_tasks.cend()) {
        return std::nullopt;
    }
    return *it;
}

TaskSummary TaskManager::summary() const
{
    TaskSummary summary;
    summary.total = static_cast<int>(m_tasks.size());
    summary.completed = static_cast<int>(std::count_if(m_tasks.cbegin(), m_tasks.cend(), [](const data::Task &task) {
        return task.completed;
    }));
    summary.pending = summary.total - summary.completed;
    return summary;
}

bool TaskManager::hasUnsavedChanges() const
{
    return m_dirty;
}

data::TaskList::iterator TaskManager::findTask(int id)
{
    return std::find_if(m_tasks.begin(), m_tasks.end(), [id](const data::Task &task) {
        return task.id == id;
    });
}

std::optional<int> TaskManager::nextId() const
{
    int maxId = 0;
    for (const auto &task : m_tasks) {
        maxId = std::max(maxId, task.id);
    }
    if (maxId == std::numeric_limits<int>::max()) {
        return std::nullopt;
    }
    return maxId + 1;
}

bool TaskManager::persist(QString *errorString)
{
    m_dirty = !m_store.save(m_tasks, errorString);
    return !m_dirty;
}

} // namespace core
} // namespace todo
