#pragma once

#include <QString>
#include <QStringList>
#include <QTextStream>

namespace todo {
namespace core {
class TaskManager;
struct TaskResult;
}

namespace app {

enum ExitCode
{
    ExitOk = 0,
    ExitUserError = 1,
    ExitStorageError = 2,
    ExitUsage = 64,
};

// Maps a command and its arguments onto TaskManager calls and prints plain text.
class CommandRunner
{
public:
    CommandRunner(core::TaskManager &manager, QString storageLocation, QTextStream &out, QTextStream &err);

    int run(const QStringList &arguments);

private:
    int add(const QStringList &words);
    int list();
    int complete(const QString &idArgument);
    int remove(const QString &idArgument);
    int clear();

    int reportFailure(const core::TaskResult &result, const QString &idArgument);
    int reportSaveFailure(const QString &errorString);

    core::TaskManager &m_manager;
    QString m_storageLocation;
    QTextStream &m_out;
    QTextStream &m_err;
};

} // namespace app
} // namespace todo
