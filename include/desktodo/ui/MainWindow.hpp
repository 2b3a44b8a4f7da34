#pragma once

#include <QList>
#include <QMainWindow>
#include <QModelIndex>
#include <QUuid>
#include <memory>

#include "desktodo/data/Task.hpp"

class QAction;
class QCheckBox;
class QComboBox;
class QLabel;
class QLineEdit;
class QPushButton;
class QTimer;

namespace desktodo {
namespace core {
class AppContext;
class UndoCommand;
struct ReminderEntry;
}

namespace ui {

class TaskFilterProxyModel;
class TaskListView;
class TaskListViewModel;

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    explicit MainWindow(const QString &dataFile = QString(), QWidget *parent = nullptr);
    ~MainWindow() override;

    void setDarkMode(bool enabled);
    // Shows startup problems (unusable data directory, corrupted file) once the window is visible.
    void reportStartupProblems();

protected:
    void closeEvent(QCloseEvent *event) override;
    bool eventFilter(QObject *watched, QEvent *event) override;

private:
    void setupUi();
    void setupMenus();
    QWidget *createHeader();
    QWidget *createFilterRow();
    QWidget *createAddRow();
    QWidget *createButtonRow();
    void setupStatusBar();

    void refreshTasks();
    void refreshReminders();
    void updateUndoActions();
    void updateButtonStates();
    void refreshCategoryFilter();
    void updateFilterState();
    void showStatus(const QString &message);
    bool checkPersistence();
    void execute(std::unique_ptr<core::UndoCommand> command, const QString &message);

    QList<data::TaskItem> selectedTasks() const;
    QList<QUuid> selectedTaskIds() const;

    void addTask();
    void toggleSelected();
    void deleteSelected();
    void setReminderForSelected();
    void clearCompleted();
    void showStatistics();
    void reloadTasks();
    void openSettingsDialog();
    void performUndo();
    void performRedo();
    void showTaskMenu(const QPoint &globalPos);
    void handleDoubleClick(const QModelIndex &index);
    void showReminder(const core::ReminderEntry &entry);
    void updateClock();

    std::unique_ptr<core::AppContext> m_appContext;
    std::unique_ptr<TaskListViewModel> m_taskViewModel;
    std::unique_ptr<TaskFilterProxyModel> m_proxyModel;

    QLineEdit *m_searchField = nullptr;
    QLineEdit *m_titleEdit = nullptr;
    QComboBox *m_categoryCombo = nullptr;
    QComboBox *m_statusFilterCombo = nullptr;
    QComboBox *m_categoryFilterCombo = nullptr;
    TaskListView *m_taskView = nullptr;
    QCheckBox *m_darkModeCheck = nullptr;
    QPushButton *m_toggleButton = nullptr;
    QPushButton *m_deleteButton = nullptr;
    QPushButton *m_reminderButton = nullptr;
    QPushButton *m_clearCompletedButton = nullptr;
    QLabel *m_countLabel = nullptr;
    QLabel *m_clockLabel = nullptr;
    QTimer *m_clockTimer = nullptr;
    QAction *m_undoAction = nullptr;
    QAction *m_redoAction = nullptr;
    bool m_darkMode = false;
};

} // namespace ui
} // namespace desktodo
