#include "desktodo/ui/MainWindow.hpp"

#include <QAction>
#include <QApplication>
#include <QCheckBox>
#include <QCloseEvent>
#include <QComboBox>
#include <QDateTime>
#include <QHBoxLayout>
#include <QItemSelectionModel>
#include <QKeyEvent>
#include <QLabel>
#include <QLineEdit>
#include <QMenu>
#include <QMenuBar>
#include <QMessageBox>
#include <QPushButton>
#include <QShortcut>
#include <QSignalBlocker>
#include <QStatusBar>
#include <QTimer>
#include <QVBoxLayout>
#include <algorithm>

#include "desktodo/core/AppContext.hpp"
#include "desktodo/core/AppSettings.hpp"
#include "desktodo/core/Logging.hpp"
#include "desktodo/core/ReminderScheduler.hpp"
#include "desktodo/core/TaskCommands.hpp"
#include "desktodo/core/TaskStatistics.hpp"
#include "desktodo/core/UndoStack.hpp"
#include "desktodo/data/JsonTaskStorage.hpp"
#include "desktodo/data/TaskRepository.hpp"
#include "desktodo/ui/Theme.hpp"
#include "desktodo/ui/dialogs/ReminderDialog.hpp"
#include "desktodo/ui/dialogs/SettingsDialog.hpp"
#include "desktodo/ui/dialogs/StatisticsDialog.hpp"
#include "desktodo/ui/models/TaskFilterProxyModel.hpp"
#include "desktodo/ui/models/TaskListModel.hpp"
#include "desktodo/ui/viewmodels/TaskListViewModel.hpp"
#include "desktodo/ui/widgets/TaskListView.hpp"

namespace desktodo {
namespace ui {

namespace {
constexpr int ReminderPopupTimeoutMs = 5000;
constexpr int ClockIntervalMs = 1000;
} // namespace

MainWindow::MainWindow(const QString &dataFile, QWidget *parent)
    : QMainWindow(parent)
    , m_appContext(std::make_unique<core::AppContext>(dataFile))
    , m_taskViewModel(std::make_unique<TaskListViewModel>(m_appContext->taskRepository()))
    , m_proxyModel(std::make_unique<TaskFilterProxyModel>())
{
    m_proxyModel->setSourceModel(m_taskViewModel->model());
    setupUi();

    auto &scheduler = m_appContext->reminderScheduler();
    connect(&scheduler, &core::ReminderScheduler::reminderDue, this, &MainWindow::showReminder);
    scheduler.start();

    const QByteArray geometry = m_appContext->settings().windowGeometry();
    if (geometry.isEmpty() || !restoreGeometry(geometry)) {
        resize(720, 640);
    }
    setDarkMode(m_appContext->settings().darkMode());
    refreshTasks();
    updateUndoActions();
}

MainWindow::~MainWindow()
{
    if (m_appContext) {
        m_appContext->reminderScheduler().stop();
    }
}

void MainWindow::setupUi()
{
    setWindowTitle(tr("Desk Todo"));

    auto *centralWidget = new QWidget(this);
    auto *layout = new QVBoxLayout(centralWidget);
    layout->setContentsMargins(10, 10, 10, 10);
    layout->setSpacing(8);

    layout->addWidget(createHeader());

    layout->addWidget(createFilterRow());

    layout->addWidget(createAddRow());

    m_taskView = new TaskListView(centralWidget);
    m_taskView->setObjectName(QStringLiteral("taskList"));
    m_taskView->setPlaceholderText(tr("Noch keine Aufgaben. Lege oben eine neue Aufgabe an."));
    m_taskView->setModel(m_proxyModel.get());
    connect(m_taskView->selectionModel(),
            &QItemSelectionModel::selectionChanged,
            this,
            [this](const QItemSelection &, const QItemSelection &) { updateButtonStates(); });
    connect(m_taskView, &TaskListView::doubleClicked, this, &MainWindow::handleDoubleClick);
    connect(m_taskView, &TaskListView::toggleRequested, this, &MainWindow::toggleSelected);
    connect(m_taskView, &TaskListView::deleteRequested, this, &MainWindow::deleteSelected);
    connect(m_taskView, &TaskListView::taskMenuRequested, this, &MainWindow::showTaskMenu);
    layout->addWidget(m_taskView, 1);

    layout->addWidget(createButtonRow());
    setCentralWidget(centralWidget);

    setupMenus();
    setupStatusBar();

    connect(m_taskViewModel.get(), &TaskListViewModel::tasksChanged, this, [this]() {
        refreshCategoryFilter();
        updateFilterState();
    });

    auto *newTaskShortcut = new QShortcut(QKeySequence(Qt::CTRL | Qt::Key_N), this);
    connect(newTaskShortcut, &QShortcut::activated, this, [this]() {
        m_titleEdit->setFocus(Qt::ShortcutFocusReason);
        m_titleEdit->selectAll();
    });

    auto *focusSearchShortcut = new QShortcut(QKeySequence(Qt::CTRL | Qt::Key_F), this);
    connect(focusSearchShortcut, &QShortcut::activated, this, [this]() {
        m_searchField->setFocus(Qt::ShortcutFocusReason);
        m_searchField->selectAll();
    });
}

void MainWindow::setupMenus()
{
    auto *fileMenu = menuBar()->addMenu(tr("&Datei"));
    auto *reloadAction = fileMenu->addAction(tr("Neu laden"));
    reloadAction->setShortcut(QKeySequence::Refresh);
    connect(reloadAction, &QAction::triggered, this, &MainWindow::reloadTasks);
    auto *settingsAction = fileMenu->addAction(tr("Einstellungen…"));
    connect(settingsAction, &QAction::triggered, this, &MainWindow::openSettingsDialog);
    fileMenu->addSeparator();
    auto *quitAction = fileMenu->addAction(tr("Beenden"));
    quitAction->setShortcut(QKeySequence::Quit);
    connect(quitAction, &QAction::triggered, this, &QWidget::close);

    auto *editMenu = menuBar()->addMenu(tr("&Bearbeiten"));
    m_undoAction = editMenu->addAction(tr("Rückgängig"));
    m_undoAction->setShortcut(QKeySequence(Qt::CTRL | Qt::Key_Z));
    connect(m_undoAction, &QAction::triggered, this, &MainWindow::performUndo);

    m_redoAction = editMenu->addAction(tr("Wiederholen"));
    m_redoAction->setShortcuts({ QKeySequence(Qt::CTRL | Qt::Key_Y), QKeySequence(Qt::CTRL | Qt::SHIFT | Qt::Key_Z) });
    connect(m_redoAction, &QAction::triggered, this, &MainWindow::performRedo);

    editMenu->addSeparator();
    auto *statisticsAction = editMenu->addAction(tr("Statistiken…"));
    connect(statisticsAction, &QAction::triggered, this, &MainWindow::showStatistics);
}

QWidget *MainWindow::createHeader()
{
    auto *header = new QWidget(this);
    auto *layout = new QHBoxLayout(header);
    layout->setContentsMargins(0, 0, 0, 0);

    auto *title = new QLabel(tr("Meine Aufgaben"), header);
    title->setObjectName(QStringLiteral("headerTitle"));
    QFont titleFont = title->font();
    titleFont.setBold(true);
    titleFont.setPointSizeF(titleFont.pointSizeF() * 1.4);
    title->setFont(titleFont);
    layout->addWidget(title);

    m_countLabel = new QLabel(header);
    layout->addWidget(m_countLabel);
    layout->addStretch(1);

    m_darkModeCheck = new QCheckBox(tr("Dunkelmodus"), header);
    connect(m_darkModeCheck, &QCheckBox::toggled, this, [this](bool checked) {
        m_appContext->settings().setDarkMode(checked);
        setDarkMode(checked);
        showStatus(checked ? tr("Dunkelmodus aktiviert") : tr("Hellmodus aktiviert"));
    });
    layout->addWidget(m_darkModeCheck);
    return header;
}

QWidget *MainWindow::createFilterRow()
{
    auto *row = new QWidget(this);
    auto *layout = new QHBoxLayout(row);
    layout->setContentsMargins(0, 0, 0, 0);

    m_searchField = new QLineEdit(row);
    m_searchField->setPlaceholderText(tr("Suchen nach Titel oder Kategorie…"));
    m_searchField->setClearButtonEnabled(true);
    m_searchField->installEventFilter(this);
    connect(m_searchField, &QLineEdit::textChanged, this, [this](const QString &text) {
        m_proxyModel->setFilterText(text);
        updateFilterState();
    });
    layout->addWidget(m_searchField, 1);

    m_statusFilterCombo = new QComboBox(row);
    m_statusFilterCombo->addItem(tr("Alle"));
    m_statusFilterCombo->addItem(tr("Offen"), false);
    m_statusFilterCombo->addItem(tr("Erledigt"), true);
    connect(m_statusFilterCombo, QOverload<int>::of(&QComboBox::currentIndexChanged), this, [this]() {
        const QVariant completed = m_statusFilterCombo->currentData();
        m_proxyModel->setCompletionFilter(completed.isValid() ? std::optional<bool>(completed.toBool()) : std::nullopt);
        updateFilterState();
    });
    layout->addWidget(m_statusFilterCombo);

    m_categoryFilterCombo = new QComboBox(row);
    m_categoryFilterCombo->setMinimumWidth(130);
    connect(m_categoryFilterCombo, QOverload<int>::of(&QComboBox::currentIndexChanged), this, [this]() {
        m_proxyModel->setCategoryFilter(m_categoryFilterCombo->currentData().toString());
        updateFilterState();
    });
    layout->addWidget(m_categoryFilterCombo);
    refreshCategoryFilter();
    return row;
}

void MainWindow::refreshCategoryFilter()
{
    QStringList categories = data::categories::all();
    for (const auto &task : m_appContext->taskRepository().fetchTasks()) {
        if (!task.category.isEmpty() && !categories.contains(task.category, Qt::CaseInsensitive)) {
            categories.append(task.category);
        }
    }

    const QString current = m_categoryFilterCombo->currentData().toString();
    QSignalBlocker blocker(m_categoryFilterCombo);
    m_categoryFilterCombo->clear();
    m_categoryFilterCombo->addItem(tr("Alle Kategorien"), QString());
    for (const auto &category : qAsConst(categories)) {
        m_categoryFilterCombo->addItem(category, category);
    }
    const int index = m_categoryFilterCombo->findData(current);
    m_categoryFilterCombo->setCurrentIndex(index >= 0 ? index : 0);
    if (index < 0) {
        m_proxyModel->setCategoryFilter(QString());
    }
}

void MainWindow::updateFilterState()
{
    const int total = m_taskViewModel->taskCount();
    const int pending = static_cast<int>(m_appContext->taskRepository().pendingTasks().size());
    if (m_proxyModel->isFiltering()) {
        m_countLabel->setText(tr("%1 angezeigt / %2 offen / %3 gesamt").arg(m_proxyModel->rowCount()).arg(pending).arg(total));
    } else {
        m_countLabel->setText(tr("%1 offen / %2 gesamt").arg(pending).arg(total));
    }

    if (total == 0) {
        m_taskView->setPlaceholderText(tr("Noch keine Aufgaben. Lege oben eine neue Aufgabe an."));
    } else if (!m_proxyModel->filterText().isEmpty()) {
        m_taskView->setPlaceholderText(tr("Keine Aufgabe passt zu „%1“.").arg(m_proxyModel->filterText()));
    } else {
        m_taskView->setPlaceholderText(tr("Keine Aufgabe passt zum Filter."));
    }
    updateButtonStates();
}

QWidget *MainWindow::createAddRow()
{
    auto *row = new QWidget(this);
    auto *layout = new QHBoxLayout(row);
    layout->setContentsMargins(0, 0, 0, 0);

    m_titleEdit = new QLineEdit(row);
    m_titleEdit->setPlaceholderText(tr("Neue Aufgabe…"));
    connect(m_titleEdit, &QLineEdit::returnPressed, this, &MainWindow::addTask);
    layout->addWidget(m_titleEdit, 1);

    m_categoryCombo = new QComboBox(row);
    m_categoryCombo->setEditable(true);
    m_categoryCombo->addItems(data::categories::all());
    m_categoryCombo->setInsertPolicy(QComboBox::NoInsert);
    m_categoryCombo->setMinimumWidth(130);
    connect(m_categoryCombo->lineEdit(), &QLineEdit::returnPressed, this, &MainWindow::addTask);
    layout->addWidget(m_categoryCombo);

    auto *addButton = new QPushButton(tr("Hinzufügen"), row);
    addButton->setDefault(true);
    connect(addButton, &QPushButton::clicked, this, &MainWindow::addTask);
    layout->addWidget(addButton);
    return row;
}

QWidget *MainWindow::createButtonRow()
{
    auto *row = new QWidget(this);
    auto *layout = new QHBoxLayout(row);
    layout->setContentsMargins(0, 0, 0, 0);

    m_toggleButton = new QPushButton(tr("Erledigt umschalten"), row);
    connect(m_toggleButton, &QPushButton::clicked, this, &MainWindow::toggleSelected);
    layout->addWidget(m_toggleButton);

    m_deleteButton = new QPushButton(tr("Löschen"), row);
    connect(m_deleteButton, &QPushButton::clicked, this, &MainWindow::deleteSelected);
    layout->addWidget(m_deleteButton);

    m_reminderButton = new QPushButton(tr("Erinnerung"), row);
    connect(m_reminderButton, &QPushButton::clicked, this, &MainWindow::setReminderForSelected);
    layout->addWidget(m_reminderButton);

    m_clearCompletedButton = new QPushButton(tr("Erledigte entfernen"), row);
    connect(m_clearCompletedButton, &QPushButton::clicked, this, &MainWindow::clearCompleted);
    layout->addWidget(m_clearCompletedButton);

    layout->addStretch(1);

    auto *statisticsButton = new QPushButton(tr("Statistiken"), row);
    connect(statisticsButton, &QPushButton::clicked, this, &MainWindow::showStatistics);
    layout->addWidget(statisticsButton);

    auto *reloadButton = new QPushButton(tr("Neu laden"), row);
    connect(reloadButton, &QPushButton::clicked, this, &MainWindow::reloadTasks);
    layout->addWidget(reloadButton);
    return row;
}

void MainWindow::setupStatusBar()
{
    m_clockLabel = new QLabel(this);
    statusBar()->addPermanentWidget(m_clockLabel);
    connect(statusBar(), &QStatusBar::messageChanged, this, [this](const QString &message) {
        if (message.isEmpty()) {
            statusBar()->showMessage(tr("Bereit"));
        }
    });
    statusBar()->showMessage(tr("Bereit"));

    m_clockTimer = new QTimer(this);
    m_clockTimer->setInterval(ClockIntervalMs);
    connect(m_clockTimer, &QTimer::timeout, this, &MainWindow::updateClock);
    m_clockTimer->start();
    updateClock();
}

void MainWindow::setDarkMode(bool enabled)
{
    m_darkMode = enabled;
    applyTheme(enabled);
    m_taskViewModel->model()->setCompletedColor(completedTaskColor(enabled));
    if (m_darkModeCheck) {
        QSignalBlocker blocker(m_darkModeCheck);
        m_darkModeCheck->setChecked(enabled);
    }
}

void MainWindow::reportStartupProblems()
{
    const QString startupError = m_appContext->startupError();
    if (!startupError.isEmpty()) {
        QMessageBox::critical(this,
                              tr("Datenverzeichnis"),
                              tr("%1\n\nÄnderungen können erst gespeichert werden, wenn das Verzeichnis beschreibbar ist.")
                                  .arg(startupError));
    }

    const auto &storage = m_appContext->storage();
    switch (storage.lastLoadStatus()) {
    case data::LoadStatus::Corrupted: {
        const QString backup = storage.corruptBackupPath();
        QMessageBox::warning(this,
                             tr("Beschädigte Aufgabendatei"),
                             backup.isEmpty()
                                 ? tr("Die Datei %1 konnte weder gelesen noch gesichert werden. Sie wird nicht "
                                      "überschrieben, bis sie repariert und neu geladen wurde.")
                                       .arg(storage.filePath())
                                 : tr("Die Datei %1 konnte nicht gelesen werden und wurde als %2 gesichert. "
                                      "Es wird mit einer leeren Liste begonnen.")
                                       .arg(storage.filePath(), backup));
        break;
    }
    case data::LoadStatus::Unreadable:
        QMessageBox::warning(this,
                             tr("Aufgabendatei"),
                             tr("%1\n\nDie Datei wird nicht überschrieben, bis sie wieder gelesen werden kann "
                                "(Datei > Neu laden).")
                                 .arg(storage.lastError()));
        break;
    case data::LoadStatus::Missing:
    case data::LoadStatus::Loaded:
        break;
    }
    if (storage.skippedRecords() > 0) {
        showStatus(tr("%n ungültige(r) Eintrag/Einträge übersprungen", nullptr, storage.skippedRecords()));
    }
}

void MainWindow::closeEvent(QCloseEvent *event)
{
    auto &storage = m_appContext->storage();
    if (!storage.save()) {
        const auto answer = QMessageBox::question(this,
                                                  tr("Speichern fehlgeschlagen"),
                                                  tr("Die Aufgaben konnten nicht nach %1 gespeichert werden:\n%2\n\n"
                                                     "Trotzdem beenden? Nicht gespeicherte Änderungen gehen verloren.")
                                                      .arg(storage.filePath(), storage.lastError()),
                                                  QMessageBox::Yes | QMessageBox::No,
                                                  QMessageBox::No);
        if (answer != QMessageBox::Yes) {
            event->ignore();
            return;
        }
        qCWarning(lcUi) << "Closing with unsaved changes in" << storage.filePath();
    }
    m_appContext->reminderScheduler().stop();
    m_appContext->settings().setWindowGeometry(saveGeometry());
    qCInfo(lcUi) << "Main window closed";
    event->accept();
}

bool MainWindow::eventFilter(QObject *watched, QEvent *event)
{
    if (watched == m_searchField && event) {
        if (event->type() == QEvent::ShortcutOverride || event->type() == QEvent::KeyPress) {
            auto *keyEvent = static_cast<QKeyEvent *>(event);
            if (keyEvent->key() == Qt::Key_Escape && !m_searchField->text().isEmpty()) {
                m_searchField->clear();
                event->accept();
                return true;
            }
        }
    }
    return QMainWindow::eventFilter(watched, event);
}

void MainWindow::refreshTasks()
{
    const QList<QUuid> selection = selectedTaskIds();
    m_taskViewModel->refresh();

    auto *selectionModel = m_taskView->selectionModel();
    auto *model = m_taskViewModel->model();
    for (const auto &id : selection) {
        const QModelIndex proxyIndex = m_proxyModel->mapFromSource(model->indexOf(id));
        if (proxyIndex.isValid()) {
            selectionModel->select(proxyIndex, QItemSelectionModel::Select | QItemSelectionModel::Rows);
        }
    }
    updateButtonStates();
}

void MainWindow::refreshReminders()
{
    m_appContext->reminderScheduler().setTasks(m_appContext->taskRepository().fetchTasks());
}

void MainWindow::updateUndoActions()
{
    const auto &stack = m_appContext->undoStack();
    m_undoAction->setEnabled(stack.canUndo());
    m_undoAction->setText(stack.canUndo() ? tr("Rückgängig: %1").arg(stack.undoText()) : tr("Rückgängig"));
    m_redoAction->setEnabled(stack.canRedo());
    m_redoAction->setText(stack.canRedo() ? tr("Wiederholen: %1").arg(stack.redoText()) : tr("Wiederholen"));
}

void MainWindow::updateButtonStates()
{
    const bool hasSelection = m_taskView && m_taskView->selectionModel()
                              && m_taskView->selectionModel()->hasSelection();
    m_toggleButton->setEnabled(hasSelection);
    m_deleteButton->setEnabled(hasSelection);
    m_reminderButton->setEnabled(hasSelection);
    m_clearCompletedButton->setEnabled(!m_appContext->taskRepository().completedTasks().empty());
}

void MainWindow::showStatus(const QString &message)
{
    statusBar()->showMessage(message, m_appContext->settings().statusTimeoutMs());
}

bool MainWindow::checkPersistence()
{
    const QString error = m_appContext->taskRepository().lastError();
    if (error.isEmpty()) {
        return true;
    }
    qCWarning(lcUi) << "Persisting tasks failed:" << error;
    QMessageBox::warning(this,
                         tr("Speichern fehlgeschlagen"),
                         tr("Die Aufgaben konnten nicht nach %1 gespeichert werden:\n%2\n\n"
                            "Die Änderung bleibt erhalten und wird beim nächsten Speichern erneut geschrieben.")
                             .arg(m_appContext->storage().filePath(), error));
    statusBar()->showMessage(tr("Nicht gespeichert"), m_appContext->settings().statusTimeoutMs());
    return false;
}

void MainWindow::execute(std::unique_ptr<core::UndoCommand> command, const QString &message)
{
    m_appContext->undoStack().push(std::move(command));
    refreshTasks();
    refreshReminders();
    updateUndoActions();
    if (checkPersistence()) {
        showStatus(message);
    }
}

QList<data::TaskItem> MainWindow::selectedTasks() const
{
    QList<data::TaskItem> items;
    if (!m_taskView || !m_taskView->selectionModel()) {
        return items;
    }
    auto indexes = m_taskView->selectionModel()->selectedRows();
    std::sort(indexes.begin(), indexes.end(), [](const QModelIndex &lhs, const QModelIndex &rhs) {
        return lhs.row() < rhs.row();
    });
    auto *model = m_taskViewModel->model();
    for (const auto &index : indexes) {
        if (const auto *task = model->taskAt(m_proxyModel->mapToSource(index))) {
            items.append(*task);
        }
    }
    return items;
}

QList<QUuid> MainWindow::selectedTaskIds() const
{
    QList<QUuid> ids;
    for (const auto &task : selectedTasks()) {
        ids.append(task.id);
    }
    return ids;
}

void MainWindow::addTask()
{
    const QString title = m_titleEdit->text().trimmed();
    if (title.isEmpty()) {
        QMessageBox::warning(this, tr("Warnung"), tr("Bitte gib einen Titel für die Aufgabe ein."));
        m_titleEdit->setFocus();
        return;
    }
    const data::TaskItem task = data::makeTask(title, m_categoryCombo->currentText());
    execute(std::make_unique<core::AddTaskCommand>(m_appContext->taskRepository(), task),
            tr("Aufgabe hinzugefügt: %1").arg(task.title));
    m_titleEdit->clear();
    m_titleEdit->setFocus();
}

void MainWindow::toggleSelected()
{
    const QList<QUuid> ids = selectedTaskIds();
    if (ids.isEmpty()) {
        showStatus(tr("Keine Aufgabe ausgewählt"));
        return;
    }
    execute(std::make_unique<core::SetCompletionCommand>(m_appContext->taskRepository(), ids),
            tr("%n Aufgabe(n) umgeschaltet", nullptr, ids.size()));
}

void MainWindow::deleteSelected()
{
    const QList<data::TaskItem> tasks = selectedTasks();
    if (tasks.isEmpty()) {
        showStatus(tr("Keine Aufgabe ausgewählt"));
        return;
    }
    const QString question = tasks.size() == 1
                                 ? tr("Soll die Aufgabe \"%1\" gelöscht werden?").arg(tasks.first().title)
                                 : tr("Sollen %n Aufgaben gelöscht werden?", nullptr, tasks.size());
    if (QMessageBox::question(this, tr("Löschen bestätigen"), question) != QMessageBox::Yes) {
        return;
    }
    QList<QUuid> ids;
    for (const auto &task : tasks) {
        ids.append(task.id);
    }
    m_taskView->clearSelection();
    execute(std::make_unique<core::RemoveTasksCommand>(m_appContext->taskRepository(), ids),
            tr("%n Aufgabe(n) gelöscht", nullptr, ids.size()));
}

void MainWindow::setReminderForSelected()
{
    const QList<data::TaskItem> tasks = selectedTasks();
    if (tasks.isEmpty()) {
        showStatus(tr("Keine Aufgabe ausgewählt"));
        return;
    }
    const data::TaskItem task = tasks.first();
    ReminderDialog dialog(task.title, task.remindAt, this);
    if (dialog.exec() != QDialog::Accepted) {
        return;
    }
    if (dialog.reminderCleared() && !data::hasReminder(task)) {
        return;
    }
    const QDateTime when = dialog.reminderTime();
    execute(std::make_unique<core::SetReminderCommand>(m_appContext->taskRepository(), task.id, when),
            when.isValid() ? tr("Erinnerung für %1 gesetzt").arg(when.toString(QStringLiteral("dd.MM.yyyy hh:mm")))
                           : tr("Erinnerung entfernt"));
}

void MainWindow::clearCompleted()
{
    const auto completed = m_appContext->taskRepository().completedTasks();
    if (completed.empty()) {
        showStatus(tr("Keine erledigten Aufgaben"));
        return;
    }
    const int count = static_cast<int>(completed.size());
    if (QMessageBox::question(this,
                              tr("Erledigte entfernen"),
                              tr("Sollen %n erledigte Aufgabe(n) entfernt werden?", nullptr, count))
        != QMessageBox::Yes) {
        return;
    }
    execute(std::make_unique<core::ClearCompletedCommand>(m_appContext->taskRepository()),
            tr("%n erledigte Aufgabe(n) entfernt", nullptr, count));
}

void MainWindow::showStatistics()
{
    const QDateTime now = QDateTime::currentDateTime();
    const auto statistics = core::computeStatistics(m_appContext->taskRepository().fetchTasks(),
                                                    m_appContext->reminderScheduler().upcoming(now));
    StatisticsDialog dialog(this);
    dialog.setStatistics(statistics);
    dialog.exec();
}

void MainWindow::reloadTasks()
{
    const auto &current = m_appContext->storage();
    if (m_appContext->taskRepository().hasUnsavedChanges()) {
        const auto answer = QMessageBox::question(this,
                                                  tr("Nicht gespeicherte Änderungen"),
                                                  tr("Die letzten Änderungen konnten nicht nach %1 gespeichert werden:\n%2\n\n"
                                                     "Trotzdem neu laden? Nicht gespeicherte Änderungen gehen verloren.")
                                                      .arg(current.filePath(), current.lastError()),
                                                  QMessageBox::Yes | QMessageBox::No,
                                                  QMessageBox::No);
        if (answer != QMessageBox::Yes) {
            return;
        }
        qCWarning(lcUi) << "Reloading and discarding unsaved changes in" << current.filePath();
    }

    m_appContext->taskRepository().reload();
    m_appContext->undoStack().clear();
    refreshTasks();
    refreshReminders();
    updateUndoActions();

    const auto &storage = m_appContext->storage();
    if (storage.lastLoadStatus() == data::LoadStatus::Corrupted
        || storage.lastLoadStatus() == data::LoadStatus::Unreadable) {
        reportStartupProblems();
        return;
    }
    showStatus(tr("%n Aufgabe(n) geladen", nullptr, m_taskViewModel->taskCount()));
}

void MainWindow::openSettingsDialog()
{
    SettingsDialog dialog(m_appContext->settings(), m_appContext->storage(), this);
    connect(&dialog, &SettingsDialog::backupCreated, this, &MainWindow::showStatus);
    if (dialog.exec() != QDialog::Accepted) {
        return;
    }
    dialog.apply();
    setDarkMode(dialog.darkMode());
    showStatus(tr("Einstellungen gespeichert"));
}

void MainWindow::performUndo()
{
    auto &stack = m_appContext->undoStack();
    if (!stack.canUndo()) {
        showStatus(tr("Nichts zum Rückgängig machen"));
        return;
    }
    const QString label = stack.undoText();
    stack.undo();
    refreshTasks();
    refreshReminders();
    updateUndoActions();
    if (checkPersistence()) {
        showStatus(tr("Rückgängig: %1").arg(label));
    }
}

void MainWindow::performRedo()
{
    auto &stack = m_appContext->undoStack();
    if (!stack.canRedo()) {
        showStatus(tr("Nichts zum Wiederholen"));
        return;
    }
    const QString label = stack.redoText();
    stack.redo();
    refreshTasks();
    refreshReminders();
    updateUndoActions();
    if (checkPersistence()) {
        showStatus(tr("Wiederholt: %1").arg(label));
    }
}

void MainWindow::showTaskMenu(const QPoint &globalPos)
{
    QMenu menu(this);
    auto *toggleAction = menu.addAction(tr("Erledigt umschalten"));
    connect(toggleAction, &QAction::triggered, this, &MainWindow::toggleSelected);
    auto *reminderAction = menu.addAction(tr("Erinnerung festlegen…"));
    connect(reminderAction, &QAction::triggered, this, &MainWindow::setReminderForSelected);
    menu.addSeparator();
    auto *deleteAction = menu.addAction(tr("Löschen"));
    connect(deleteAction, &QAction::triggered, this, &MainWindow::deleteSelected);
    menu.exec(globalPos);
}

void MainWindow::handleDoubleClick(const QModelIndex &index)
{
    const auto *task = m_taskViewModel->model()->taskAt(m_proxyModel->mapToSource(index));
    if (!task) {
        return;
    }
    const QString message = task->completed ? tr("Aufgabe wieder geöffnet: %1").arg(task->title)
                                            : tr("Aufgabe erledigt: %1").arg(task->title);
    execute(std::make_unique<core::SetCompletionCommand>(m_appContext->taskRepository(), QList<QUuid>{ task->id }),
            message);
}

void MainWindow::showReminder(const core::ReminderEntry &entry)
{
    qCInfo(lcUi) << "Showing reminder for" << entry.title;
    auto *box = new QMessageBox(QMessageBox::Information,
                                tr("Erinnerung"),
                                tr("Erinnerung: %1").arg(entry.title),
                                QMessageBox::Ok,
                                this);
    box->setAttribute(Qt::WA_DeleteOnClose);
    box->setWindowFlags(box->windowFlags() | Qt::WindowStaysOnTopHint);
    box->setModal(false);
    box->show();
    box->raise();
    QApplication::alert(this);
    QTimer::singleShot(ReminderPopupTimeoutMs, box, &QMessageBox::close);
    showStatus(tr("Erinnerung: %1").arg(entry.title));
}

void MainWindow::updateClock()
{
    m_clockLabel->setText(QDateTime::currentDateTime().toString(QStringLiteral("dd.MM.yyyy hh:mm:ss")));
}

} // namespace ui
} // namespace desktodo
