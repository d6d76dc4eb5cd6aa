#include "todo/app/CommandRunner.hpp"

#include <optional>

#include "todo/app/Logger.hpp"
#include "todo/core/TaskManager.hpp"
#include "todo/data/TaskJson.hpp"

namespace todo {
namespace app {

namespace {
std::optional<int> parseTaskId(const QString &value)
{
    bool ok = false;
    const int id = value.trimmed().toInt(&ok);
    if (!ok || id <= 0) {
        return std::nullopt;
    }
    return id;
}

QString formatTaskLine(const data::Task &task)
{
    return QStringLiteral("%1. [%2] %3 (%4)")
        .arg(task.id)
        .arg(task.completed ? QStringLiteral("x") : QStringLiteral(" "))
        .arg(task.description, data::formatTimestamp(task.createdAt));
}
} // namespace

CommandRunner::CommandRunner(core::TaskManager &manager, QString storageLocation, QTextStream &out, QTextStream &err)
    : m_manager(manager)
    , m_storageLocation(std::move(storageLocation))
    , m_out(out)
    , m_err(err)
{
}

int CommandRunner::run(const QStringList &arguments)
{
    if (arguments.isEmpty()) {
        m_err << "Missing command\n";
        return ExitUsage;
    }

    const QString command = arguments.first();
    const QStringList rest = arguments.mid(1);
    qCDebug(todoCli) << "Running" << command << "with" << rest.size() << "argument(s)";

    if (command == QLatin1String("add")) {
        return add(rest);
    }
    if (command == QLatin1String("list") && rest.isEmpty()) {
        return list();
    }
    if (command == QLatin1String("complete") && rest.size() == 1) {
        return complete(rest.first());
    }
    if (command == QLatin1String("remove") && rest.size() == 1) {
        return remove(rest.first());
    }
    if (command == QLatin1String("clear") && rest.isEmpty()) {
        return clear();
    }

    m_err << "Unknown command or wrong number of arguments: " << command << '\n';
    return ExitUsage;
}

int CommandRunner::add(const QStringList &words)
{
    const auto result = m_manager.add(words.join(QLatin1Char(' ')));
    if (!result.ok()) {
        return reportFailure(result, QString());
    }
    m_out << "Task added: " << result.task->description << " (#" << result.task->id << ")\n";
    return ExitOk;
}

int CommandRunner::list()
{
    const auto &tasks = m_manager.list();
    if (tasks.empty()) {
        m_out << "Your todo list is empty.\n";
        return ExitOk;
    }

    const auto summary = m_manager.summary();
    if (summary.pending > 0) {
        m_out << "Pending tasks:\n";
        for (const auto &task : tasks) {
            if (!task.completed) {
                m_out << "  " << formatTaskLine(task) << '\n';
            }
        }
    }
    if (summary.completed > 0) {
        m_out << "Completed tasks:\n";
        for (const auto &task : tasks) {
            if (task.completed) {
                m_out << "  " << formatTaskLine(task) << '\n';
            }
        }
    }
    m_out << "Summary: " << summary.total << " total, " << summary.completed << " completed, " << summary.pending
          << " pending\n";
    return ExitOk;
}

int CommandRunner::complete(const QString &idArgument)
{
    const auto id = parseTaskId(idArgument);
    if (!id) {
        m_err << "Invalid task id: " << idArgument << '\n';
        return ExitUserError;
    }
    const auto result = m_manager.complete(*id);
    if (!result.ok()) {
        return reportFailure(result, idArgument);
    }
    m_out << "Task " << result.task->id << " marked as complete: " << result.task->description << '\n';
    return ExitOk;
}

int CommandRunner::remove(const QString &idArgument)
{
    const auto id = parseTaskId(idArgument);
    if (!id) {
        m_err << "Invalid task id: " << idArgument << '\n';
        return ExitUserError;
    }
    const auto result = m_manager.remove(*id);
    if (!result.ok()) {
        return reportFailure(result, idArgument);
    }
    m_out << "Task " << result.task->id << " removed: " << result.task->description << '\n';
    return ExitOk;
}

int CommandRunner::clear()
{
    const auto result = m_manager.clear();
    if (!result.ok()) {
        return reportSaveFailure(result.errorString);
    }
    if (result.removed == 0) {
        m_out << "No completed tasks to clear.\n";
    } else {
        m_out << "Cleared " << result.removed << " completed task(s)\n";
    }
    return ExitOk;
}

int CommandRunner::reportFailure(const core::TaskResult &result, const QString &idArgument)
{
    switch (result.error) {
    case core::TaskError::EmptyDescription:
        m_err << "Task description cannot be empty.\n";
        return ExitUserError;
    case core::TaskError::NotFound:
        m_err << "Invalid task id: " << idArgument << '\n';
        return ExitUserError;
    case core::TaskError::IdsExhausted:
        m_err << "No task id left to assign; remove the task with the highest id first.\n";
        return ExitUserError;
    case core::TaskError::SaveFailed:
        return reportSaveFailure(result.errorString);
    case core::TaskError::None:
    default:
        return ExitOk;
    }
}

int CommandRunner::reportSaveFailure(const QString &errorString)
{
    qCWarning(todoCli) << "Save failed for" << m_storageLocation << errorString;
    m_err << "Could not save tasks to " << m_storageLocation << ": " << errorString << '\n';
    return ExitStorageError;
}

} // namespace app
} // namespace todo
