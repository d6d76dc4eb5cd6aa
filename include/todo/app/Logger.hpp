#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(todoCli)

namespace todo {
namespace app {

void initLogging(bool verbose);

} // namespace app
} // namespace todo
