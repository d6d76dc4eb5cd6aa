#pragma once

#include <QByteArray>
#include <QDateTime>
#include <QString>
#include <optional>

#include "todo/data/Task.hpp"

namespace todo {
namespace data {

constexpr const char *TaskTimestampFormat = "yyyy-MM-dd hh:mm";

QString formatTimestamp(const QDateTime &dt);
QDateTime parseTimestamp(const QString &value);

QByteArray encodeTaskList(const TaskList &tasks);

// All-or-nothing: returns std::nullopt if any entry is malformed.
std::optional<TaskList> decodeTaskList(const QByteArray &payload, QString *errorString = nullptr);

} // namespace data
} // namespace todo
