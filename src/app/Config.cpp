#include "todo/app/Config.hpp"

#include <QDir>

namespace todo {
namespace app {

QString resolveStoragePath(const QString &fileOption, const QProcessEnvironment &env)
{
    if (!fileOption.trimmed().isEmpty()) {
        return fileOption.trimmed();
    }
    const QString fromEnv = env.value(QLatin1String(StorageFileEnv)).trimmed();
    if (!fromEnv.isEmpty()) {
        return fromEnv;
    }
    return QDir::current().filePath(QLatin1String(DefaultStorageFile));
}

} // namespace app
} // namespace todo
