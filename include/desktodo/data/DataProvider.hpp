#pragma once

#include <memory>
#include <QString>

#include "desktodo/data/JsonTaskStorage.hpp"

namespace desktodo {
namespace data {

class TaskRepository;

class DataProvider
{
public:
    explicit DataProvider(const QString &filePath = QString());
    ~DataProvider();

    static QString defaultDataFilePath();

    TaskRepository &taskRepository();
    JsonTaskStorage &storage();

    // Set when the data directory could not be created at startup.
    QString startupError() const;

private:
    bool ensureDataDirectory(const QString &filePath);

    QString m_startupError;
    std::shared_ptr<JsonTaskStorage> m_storage;
    std::unique_ptr<TaskRepository> m_taskRepository;
};

} // namespace data
} // namespace desktodo
