#pragma once

#include "todo/data/TaskStore.hpp"

namespace todo {
namespace data {

class InMemoryTaskStore : public TaskStore
{
public:
    InMemoryTaskStore();
    explicit InMemoryTaskStore(TaskList initial);
    ~InMemoryTaskStore() override;

    TaskList load() const override;
    bool save(const TaskList &tasks, QString *errorString = nullptr) override;
    QString location() const override;

    // While set, save() reports a write failure and keeps the old snapshot.
    void setFailSaves(bool fail);

    const TaskList &snapshot() const;
    int saveCount() const;

private:
    TaskList m_tasks;
    bool m_failSaves = false;
    int m_saveCount = 0;
};

} // namespace data
} // namespace todo
