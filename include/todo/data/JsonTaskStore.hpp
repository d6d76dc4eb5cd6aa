#pragma once

#include <QString>

#include "todo/data/TaskStore.hpp"

namespace todo {
namespace data {

class JsonTaskStore : public TaskStore
{
public:
    explicit JsonTaskStore(QString filePath);
    ~JsonTaskStore() override = default;

    TaskList load() const override;
    bool save(const TaskList &tasks, QString *errorString = nullptr) override;
    QString location() const override;

    const QString &filePath() const;

private:
    QString m_filePath;
};

} // namespace data
} // namespace todo
