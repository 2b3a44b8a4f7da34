#include "desktodo/core/Logging.hpp"

#include <QFile>
#include <QMutex>
#include <QMutexLocker>
#include <QTextStream>
#include <cstdio>
#include <memory>

Q_LOGGING_CATEGORY(lcCore, "desktodo.core")
Q_LOGGING_CATEGORY(lcStorage, "desktodo.storage")
Q_LOGGING_CATEGORY(lcReminder, "desktodo.reminder")
Q_LOGGING_CATEGORY(lcUi, "desktodo.ui")

namespace desktodo {
namespace core {

namespace {
std::unique_ptr<QFile> g_logFile;
QMutex g_logMutex;

void messageHandler(QtMsgType type, const QMessageLogContext &context, const QString &message)
{
    const QString line = qFormatLogMessage(type, context, message) + QLatin1Char('\n');
    fprintf(stderr, "%s", line.toLocal8Bit().constData());

    QMutexLocker lock(&g_logMutex);
    if (g_logFile && g_logFile->isOpen()) {
        QTextStream stream(g_logFile.get());
        stream.setCodec("UTF-8");
        stream << line;
        stream.flush();
    }
}
} // namespace

void initLogging(const QString &filePath)
{
    qSetMessagePattern(QStringLiteral("%{time yyyy-MM-dd hh:mm:ss.zzz} [%{type}] %{category}: %{message}"));

    if (!filePath.isEmpty()) {
        auto file = std::make_unique<QFile>(filePath);
        if (file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            QMutexLocker lock(&g_logMutex);
            g_logFile = std::move(file);
        } else {
            qCWarning(lcCore) << "Failed to open log file" << filePath << file->errorString();
        }
    }

    qInstallMessageHandler(messageHandler);
    qCInfo(lcCore) << "Logging initialized" << (g_logFile ? filePath : QStringLiteral("(stderr only)"));
}

void shutdownLogging()
{
    qInstallMessageHandler(nullptr);
    QMutexLocker lock(&g_logMutex);
    g_logFile.reset();
}

} // namespace core
} // namespace desktodo
