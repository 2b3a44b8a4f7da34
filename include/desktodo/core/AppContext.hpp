#pragma once

#include <QString>
#include <memory>

namespace desktodo {
namespace data {
class DataProvider;
class JsonTaskStorage;
class TaskRepository;
}

namespace core {

class AppSettings;
class ReminderScheduler;
class UndoStack;

class AppContext
{
public:
    // An empty dataFile falls back to the stored setting, then to data/tasks.json beside the executable.
    explicit AppContext(const QString &dataFile = QString());
    ~AppContext();

    data::TaskRepository &taskRepository();
    data::JsonTaskStorage &storage();
    UndoStack &undoStack();
    ReminderScheduler &reminderScheduler();
    AppSettings &settings();

    QString startupError() const;

private:
    std::unique_ptr<AppSettings> m_settings;
    std::unique_ptr<data::DataProvider> m_dataProvider;
    std::unique_ptr<UndoStack> m_undoStack;
    std::unique_ptr<ReminderScheduler> m_reminderScheduler;
};

} // namespace core
} // namespace desktodo
