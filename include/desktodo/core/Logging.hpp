#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(lcCore)
Q_DECLARE_LOGGING_CATEGORY(lcStorage)
Q_DECLARE_LOGGING_CATEGORY(lcReminder)
Q_DECLARE_LOGGING_CATEGORY(lcUi)

namespace desktodo {
namespace core {

// Installs a message handler writing to stderr and, if filePath is set, appending to that file.
void initLogging(const QString &filePath = QString());
void shutdownLogging();

} // namespace core
} // namespace desktodo
