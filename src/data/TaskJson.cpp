#include "todo/data/TaskJson.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <QSet>
#include <cmath>
#include <limits>

namespace todo {
namespace data {

namespace {
constexpr auto KEY_ID = "id";
constexpr auto KEY_DESCRIPTION = "description";
constexpr auto KEY_COMPLETED = "completed";
constexpr auto KEY_CREATED = "created";

void setError(QString *errorString, const QString &message)
{
    if (errorString) {
        *errorString = message;
    }
}

std::optional<int> positiveInt(const QJsonValue &value)
{
    if (!value.isDouble()) {
        return std::nullopt;
    }
    const double raw = value.toDouble();
    if (raw != std::floor(raw) || raw < 1.0 || raw > std::numeric_limits<int>::max()) {
        return std::nullopt;
    }
    return static_cast<int>(raw);
}

QJsonObject toJson(const Task &task)
{
    return QJsonObject{{KEY_ID, task.id},
                       {KEY_DESCRIPTION, task.description},
                       {KEY_COMPLETED, task.completed},
                       {KEY_CREATED, formatTimestamp(task.createdAt)}};
}

std::optional<Task> fromJsonStrict(const QJsonValue &value, int index, QString *errorString)
{
    if (!value.isObject()) {
        setError(errorString, QStringLiteral("Entry %1 is not an object").arg(index));
        return std::nullopt;
    }
    const QJsonObject obj = value.toObject();

    for (const char *key : {KEY_ID, KEY_DESCRIPTION, KEY_COMPLETED, KEY_CREATED}) {
        if (!obj.contains(QLatin1String(key))) {
            setError(errorString, QStringLiteral("Entry %1: missing field: %2").arg(index).arg(QLatin1String(key)));
            return std::nullopt;
        }
    }

    Task task;

    const auto id = positiveInt(obj.value(QLatin1String(KEY_ID)));
    if (!id) {
        setError(errorString, QStringLiteral("Entry %1: id must be a positive integer").arg(index));
        return std::nullopt;
    }
    task.id = *id;

    const QJsonValue description = obj.value(QLatin1String(KEY_DESCRIPTION));
    if (!description.isString() || description.toString().trimmed().isEmpty()) {
        setError(errorString, QStringLiteral("Entry %1: description must be a non-empty string").arg(index));
        return std::nullopt;
    }
    task.description = description.toString().trimmed();

    const QJsonValue completed = obj.value(QLatin1String(KEY_COMPLETED));
    if (!completed.isBool()) {
        setError(errorString, QStringLiteral("Entry %1: completed must be a boolean").arg(index));
        return std::nullopt;
    }
    task.completed = completed.toBool();

    const QJsonValue created = obj.value(QLatin1String(KEY_CREATED));
    task.createdAt = created.isString() ? parseTimestamp(created.toString()) : QDateTime();
    if (!task.createdAt.isValid()) {
        setError(errorString, QStringLiteral("Entry %1: created must match %2")
                                  .arg(index)
                                  .arg(QLatin1String(TaskTimestampFormat)));
        return std::nullopt;
    }

    return task;
}
} // namespace

QString formatTimestamp(const QDateTime &dt)
{
    if (!dt.isValid()) {
        return {};
    }
    return dt.toString(QLatin1String(TaskTimestampFormat));
}

QDateTime parseTimestamp(const QString &value)
{
    return QDateTime::fromString(value, QLatin1String(TaskTimestampFormat));
}

QByteArray encodeTaskList(const TaskList &tasks)
{
    QJsonArray array;
    for (const Task &task : tasks) {
        array.append(toJson(task));
    }
    return QJsonDocument(array).toJson(QJsonDocument::Indented);
}

std::optional<TaskList> decodeTaskList(const QByteArray &payload, QString *errorString)
{
    QJsonParseError parseError{};
    const QJsonDocument doc = QJsonDocument::fromJson(payload, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        setError(errorString, parseError.errorString());
        return std::nullopt;
    }
    if (!doc.isArray()) {
        setError(errorString, QStringLiteral("Top-level value is not an array"));
        return std::nullopt;
    }

    const QJsonArray array = doc.array();
    TaskList tasks;
    tasks.reserve(static_cast<size_t>(array.size()));
    QSet<int> seenIds;
    for (int i = 0; i < array.size(); ++i) {
        auto task = fromJsonStrict(array.at(i), i, errorString);
        if (!task) {
            return std::nullopt;
        }
        if (seenIds.contains(task->id)) {
            setError(errorString, QStringLiteral("Entry %1: duplicate id %2").arg(i).arg(task->id));
            return std::nullopt;
        }
        seenIds.insert(task->id);
        tasks.push_back(std::move(*task));
    }
    return tasks;
}

} // namespace data
} // namespace todo
