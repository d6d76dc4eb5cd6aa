#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QString>
#include <QTextStream>
#include <cstdio>

#include "version.h"

#include "todo/app/CommandRunner.hpp"
#include "todo/app/Config.hpp"
#include "todo/app/Logger.hpp"
#include "todo/core/AppContext.hpp"
#include "todo/core/TaskManager.hpp"
#include "todo/data/TaskStore.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("todo-cli"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kTodoCliVersion));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Track short text tasks from the command line."));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption fileOption(QStringList{QStringLiteral("f"), QStringLiteral("file")},
                                        QStringLiteral("Task storage file (default: $TODO_FILE or ./todos.json)."),
                                        QStringLiteral("path"));
    const QCommandLineOption verboseOption(QStringList{QStringLiteral("v"), QStringLiteral("verbose")},
                                           QStringLiteral("Print debug diagnostics to stderr."));
    parser.addOption(fileOption);
    parser.addOption(verboseOption);
    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("add <text...> | list | complete <id> | remove <id> | clear"));
    parser.process(app);

    todo::app::initLogging(parser.isSet(verboseOption));

    const QStringList arguments = parser.positionalArguments();
    if (arguments.isEmpty()) {
        parser.showHelp(todo::app::ExitUsage);
    }

    const QString storagePath = todo::app::resolveStoragePath(parser.value(fileOption));
    qCDebug(todoCli) << "Using storage file" << storagePath;

    todo::core::AppContext context(storagePath);
    qCDebug(todoCli) << "Loaded" << context.taskManager().list().size() << "task(s)";

    QTextStream out(stdout);
    QTextStream err(stderr);
    todo::app::CommandRunner runner(context.taskManager(), context.taskStore().location(), out, err);
    const int exitCode = runner.run(arguments);
    if (exitCode == todo::app::ExitUsage) {
        err.flush();
        parser.showHelp(exitCode);
    }
    return exitCode;
}
