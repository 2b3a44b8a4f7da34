#include "desktodo/data/DataProvider.hpp"

#include "desktodo/core/Logging.hpp"
#include "desktodo/data/FileTaskRepository.hpp"
#include "desktodo/data/TaskRepository.hpp"

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QObject>

namespace desktodo {
namespace data {

DataProvider::DataProvider(const QString &filePath)
{
    const QString resolved = filePath.isEmpty() ? defaultDataFilePath() : QFileInfo(filePath).absoluteFilePath();
    ensureDataDirectory(resolved);

    m_storage = std::make_shared<JsonTaskStorage>(resolved);
    m_taskRepository = std::make_unique<FileTaskRepository>(m_storage);
}

DataProvider::~DataProvider() = default;

QString DataProvider::defaultDataFilePath()
{
    QString baseFolder = QCoreApplication::instance() ? QCoreApplication::applicationDirPath() : QString();
    if (baseFolder.isEmpty()) {
        baseFolder = QDir::currentPath();
    }
    return QDir(baseFolder).filePath(QStringLiteral("data/tasks.json"));
}

TaskRepository &DataProvider::taskRepository()
{
    return *m_taskRepository;
}

JsonTaskStorage &DataProvider::storage()
{
    return *m_storage;
}

QString DataProvider::startupError() const
{
    return m_startupError;
}

bool DataProvider::ensureDataDirectory(const QString &filePath)
{
    QDir dir = QFileInfo(filePath).dir();
    if (dir.exists()) {
        return true;
    }
    if (!dir.mkpath(QStringLiteral("."))) {
        m_startupError = QObject::tr("Datenordner %1 konnte nicht erstellt werden").arg(dir.path());
        qCCritical(lcStorage) << "Cannot create data directory" << dir.path();
        return false;
    }
    qCInfo(lcStorage) << "Created data directory" << dir.path();
    return true;
}

} // namespace data
} // namespace desktodo
