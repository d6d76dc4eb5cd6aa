#include "todo/app/Logger.hpp"

#include <QString>
#include <cstdio>

Q_LOGGING_CATEGORY(todoCli, "todo.cli", QtInfoMsg)

namespace todo {
namespace app {

namespace {
void messageHandler(QtMsgType type, const QMessageLogContext &ctx, const QString &msg)
{
    const QString line = qFormatLogMessage(type, ctx, msg) + QLatin1Char('\n');
    std::fprintf(stderr, "%s", line.toLocal8Bit().constData());
}
} // namespace

void initLogging(bool verbose)
{
    qSetMessagePattern(QStringLiteral("%{time hh:mm:ss.zzz} [%{type}] %{category}: %{message}"));
    if (verbose) {
        QLoggingCategory::setFilterRules(QStringLiteral("todo.*.debug=true"));
    }
    qInstallMessageHandler(messageHandler);
}

} // namespace app
} // namespace todo
