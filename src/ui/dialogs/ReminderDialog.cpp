#include "desktodo/ui/dialogs/ReminderDialog.hpp"

#include <QDateEdit>
#include <QDialogButtonBox>
#include <QFormLayout>
#include <QGridLayout>
#include <QGroupBox>
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <QVBoxLayout>

#include "desktodo/core/Logging.hpp"
#include "desktodo/core/ReminderTime.hpp"

namespace desktodo {
namespace ui {

ReminderDialog::ReminderDialog(const QString &taskTitle, const QDateTime &current, QWidget *parent)
    : QDialog(parent)
    , m_reminderTime(current)
{
    setWindowTitle(tr("Erinnerung festlegen"));
    auto *layout = new QVBoxLayout(this);

    auto *taskLabel = new QLabel(tr("Aufgabe: %1").arg(taskTitle), this);
    taskLabel->setWordWrap(true);
    QFont taskFont = taskLabel->font();
    taskFont.setBold(true);
    taskLabel->setFont(taskFont);
    layout->addWidget(taskLabel);

    auto *formLayout = new QFormLayout();

    m_dateEdit = new QDateEdit(this);
    m_dateEdit->setDisplayFormat(QStringLiteral("yyyy-MM-dd"));
    m_dateEdit->setCalendarPopup(true);
    formLayout->addRow(tr("Datum"), m_dateEdit);

    m_timeEdit = new QLineEdit(this);
    m_timeEdit->setPlaceholderText(tr("z. B. 14:30 oder 2:30 PM"));
    formLayout->addRow(tr("Uhrzeit"), m_timeEdit);

    if (current.isValid()) {
        m_dateEdit->setDate(current.date());
        m_timeEdit->setText(current.time().toString(QStringLiteral("hh:mm")));
    } else {
        const QDateTime suggestion = QDateTime::currentDateTime().addSecs(60 * 60);
        m_dateEdit->setDate(suggestion.date());
        m_timeEdit->setText(suggestion.time().toString(QStringLiteral("hh:mm")));
    }
    layout->addLayout(formLayout);

    auto *quickGroup = new QGroupBox(tr("Schnellauswahl"), this);
    auto *quickLayout = new QGridLayout(quickGroup);
    const auto options = core::quickReminderOptions();
    int slot = 0;
    for (const auto &option : options) {
        auto *button = new QPushButton(option.label, quickGroup);
        const QDateTime when = option.dateTime;
        connect(button, &QPushButton::clicked, this, [this, when]() { applyQuickOption(when); });
        quickLayout->addWidget(button, slot / 3, slot % 3);
        ++slot;
    }
    layout->addWidget(quickGroup);

    m_errorLabel = new QLabel(this);
    m_errorLabel->setStyleSheet(QStringLiteral("color: #c0392b;"));
    m_errorLabel->setWordWrap(true);
    m_errorLabel->hide();
    layout->addWidget(m_errorLabel);

    auto *buttonBox = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel, this);
    auto *clearButton = buttonBox->addButton(tr("Erinnerung entfernen"), QDialogButtonBox::ResetRole);
    clearButton->setEnabled(current.isValid());
    connect(clearButton, &QPushButton::clicked, this, &ReminderDialog::clearReminder);
    connect(buttonBox, &QDialogButtonBox::accepted, this, &ReminderDialog::acceptInput);
    connect(buttonBox, &QDialogButtonBox::rejected, this, &QDialog::reject);
    layout->addWidget(buttonBox);

    m_timeEdit->setFocus();
    m_timeEdit->selectAll();
}

QDateTime ReminderDialog::reminderTime() const
{
    return m_cleared ? QDateTime() : m_reminderTime;
}

bool ReminderDialog::reminderCleared() const
{
    return m_cleared;
}

void ReminderDialog::acceptInput()
{
    const QDateTime now = QDateTime::currentDateTime();
    const QString dateText = m_dateEdit->date().toString(QStringLiteral("yyyy-MM-dd"));
    const auto parsed = core::parseReminderTime(m_timeEdit->text(), dateText, now);
    if (!parsed) {
        m_errorLabel->setText(tr("Ungültige Uhrzeit. Erlaubt sind z. B. 14:30, 2:30 PM oder 14:30:00."));
        m_errorLabel->show();
        m_timeEdit->setFocus();
        return;
    }
    if (*parsed <= now) {
        m_errorLabel->setText(tr("Die Erinnerung muss in der Zukunft liegen."));
        m_errorLabel->show();
        return;
    }
    m_reminderTime = *parsed;
    m_cleared = false;
    qCDebug(lcUi) << "Reminder chosen" << m_reminderTime;
    accept();
}

void ReminderDialog::applyQuickOption(const QDateTime &when)
{
    m_reminderTime = when;
    m_cleared = false;
    qCDebug(lcUi) << "Quick reminder chosen" << when;
    accept();
}

void ReminderDialog::clearReminder()
{
    m_cleared = true;
    m_reminderTime = QDateTime();
    accept();
}

} // namespace ui
} // namespace desktodo
