#include "desktodo/core/AppContext.hpp"

#include "desktodo/core/AppSettings.hpp"
#include "desktodo/core/Logging.hpp"
#include "desktodo/core/ReminderScheduler.hpp"
#include "desktodo/core/UndoStack.hpp"
#include "desktodo/data/DataProvider.hpp"
#include "desktodo/data/TaskRepository.hpp"

namespace desktodo {
namespace core {

namespace {
QString resolveDataFile(const QString &explicitPath, const AppSettings &settings)
{
    if (!explicitPath.isEmpty()) {
        return explicitPath;
    }
    return settings.dataFile();
}
} // namespace

AppContext::AppContext(const QString &dataFile)
    : m_settings(std::make_unique<AppSettings>())
    , m_dataProvider(std::make_unique<data::DataProvider>(resolveDataFile(dataFile, *m_settings)))
    , m_undoStack(std::make_unique<UndoStack>())
    , m_reminderScheduler(std::make_unique<ReminderScheduler>())
{
    m_reminderScheduler->setInterval(m_settings->reminderCheckIntervalMs());
    m_reminderScheduler->setTasks(m_dataProvider->taskRepository().fetchTasks());
    qCInfo(lcCore) << "Using task file" << m_dataProvider->storage().filePath();
}

AppContext::~AppContext() = default;

data::TaskRepository &AppContext::taskRepository()
{
    return m_dataProvider->taskRepository();
}

data::JsonTaskStorage &AppContext::storage()
{
    return m_dataProvider->storage();
}

UndoStack &AppContext::undoStack()
{
    return *m_undoStack;
}

ReminderScheduler &AppContext::reminderScheduler()
{
    return *m_reminderScheduler;
}

AppSettings &AppContext::settings()
{
    return *m_settings;
}

QString AppContext::startupError() const
{
    return m_dataProvider->startupError();
}

} // namespace core
} // namespace desktodo
