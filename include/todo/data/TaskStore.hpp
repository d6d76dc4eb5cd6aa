#pragma once

#include <QString>

#include "todo/data/Task.hpp"

namespace todo {
namespace data {

class TaskStore
{
public:
    virtual ~TaskStore() = default;

    // Never fails: a missing or unusable snapshot yields an empty list.
    virtual TaskList load() const = 0;
    virtual bool save(const TaskList &tasks, QString *errorString = nullptr) = 0;
    virtual QString location() const = 0;
};

} // namespace data
} // namespace todo
