#pragma once

#include <QProcessEnvironment>
#include <QString>

namespace todo {
namespace app {

constexpr const char *DefaultStorageFile = "todos.json";
constexpr const char *StorageFileEnv = "TODO_FILE";

// --file wins over TODO_FILE, which wins over todos.json in the working directory.
QString resolveStoragePath(const QString &fileOption,
                           const QProcessEnvironment &env = QProcessEnvironment::systemEnvironment());

} // namespace app
} // namespace todo
