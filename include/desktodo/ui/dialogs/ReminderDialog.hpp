#pragma once

#include <QDateTime>
#include <QDialog>

class QDateEdit;
class QLabel;
class QLineEdit;

namespace desktodo {
namespace ui {

class ReminderDialog : public QDialog
{
    Q_OBJECT

public:
    explicit ReminderDialog(const QString &taskTitle,
                            const QDateTime &current = QDateTime(),
                            QWidget *parent = nullptr);

    // Invalid when the reminder was cleared.
    QDateTime reminderTime() const;
    bool reminderCleared() const;

private:
    void acceptInput();
    void applyQuickOption(const QDateTime &when);
    void clearReminder();

    QLineEdit *m_timeEdit = nullptr;
    QDateEdit *m_dateEdit = nullptr;
    QLabel *m_errorLabel = nullptr;
    QDateTime m_reminderTime;
    bool m_cleared = false;
};

} // namespace ui
} // namespace desktodo
