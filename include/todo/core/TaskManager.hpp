#pragma once

#include <QString>
#include <optional>

#include "todo/data/Task.hpp"

namespace todo {
namespace data {
class TaskStore;
}

namespace core {

class Clock;

enum class TaskError
{
    None,
    EmptyDescription,
    NotFound,
    SaveFailed,
    IdsExhausted,
};

// On SaveFailed the mutation is kept in memory and `task` is still set.
struct TaskResult
{
    std::optional<data::Task> task;
    TaskError error = TaskError::None;
    QString errorString;

    bool ok() const { return error == TaskError::None; }
};

struct ClearResult
{
    int removed = 0;
    TaskError error = TaskError::None;
    QString errorString;

    bool ok() const { return error == TaskError::None; }
};

struct TaskSummary
{
    int total = 0;
    int completed = 0;
    int pending = 0;
};

// Owns the task list for one process invocation and writes the full list
// back to the store after every mutation.
class TaskManager
{
public:
    TaskManager(data::TaskStore &store, const Clock &clock);
    ~TaskManager();

    TaskResult add(const QString &description);
    const data::TaskList &list() const;
    TaskResult complete(int id);
    TaskResult remove(int id);
    ClearResult clear();

    std::optional<data::Task> find(int id) const;
    TaskSummary summary() const;

    // True while the most recent save attempt failed. The next mutation
    // writes the whole list again.
    bool hasUnsavedChanges() const;

private:
    data::TaskList::iterator findTask(int id);
    std::optional<int> nextId() const;
    bool persist(QString *errorString);

    data::TaskStore &m_store;
    const Clock &m_clock;
    data::TaskList m_tasks;
    bool m_dirty = false;
};

} // namespace core
} // namespace todo
