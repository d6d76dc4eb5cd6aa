#include "todo/data/JsonTaskStore.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

#include "todo/data/TaskJson.hpp"

namespace todo {
namespace data {

JsonTaskStore::JsonTaskStore(QString filePath)
    : m_filePath(std::move(filePath))
{
}

TaskList JsonTaskStore::load() const
{
    QFile file(m_filePath);
    if (!file.exists()) {
        return {};
    }
    if (!file.open(QIODevice::ReadOnly)) {
        return {};
    }

    // A damaged snapshot is discarded as a whole, never repaired.
    auto tasks = decodeTaskList(file.readAll());
    if (!tasks) {
        return {};
    }
    return std::move(*tasks);
}

bool JsonTaskStore::save(const TaskList &tasks, QString *errorString)
{
    auto fail = [errorString](const QString &message) {
        if (errorString) {
            *errorString = message;
        }
        return false;
    };

    if (m_filePath.isEmpty()) {
        return fail(QStringLiteral("No storage file configured"));
    }

    const QByteArray payload = encodeTaskList(tasks);
    QString reason;
    if (!decodeTaskList(payload, &reason)) {
        return fail(QStringLiteral("Refusing to write a snapshot that cannot be read back: %1").arg(reason));
    }

    QFileInfo info(m_filePath);
    QDir dir = info.dir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        return fail(QStringLiteral("Cannot create directory %1").arg(dir.path()));
    }

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        return fail(file.errorString());
    }

    if (file.write(payload) != payload.size()) {
        const QString message = file.errorString();
        file.cancelWriting();
        return fail(message);
    }
    if (!file.commit()) {
        return fail(file.errorString());
    }
    return true;
}

QString JsonTaskStore::location() const
{
    return QFileInfo(m_filePath).absoluteFilePath();
}

const QString &JsonTaskStore::filePath() const
{
    return m_filePath;
}

} // namespace data
} // namespace todo
