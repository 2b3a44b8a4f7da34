#include "desktodo/ui/dialogs/SettingsDialog.hpp"

#include <QCheckBox>
#include <QDialogButtonBox>
#include <QFileDialog>
#include <QFormLayout>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QListWidget>
#include <QMessageBox>
#include <QPushButton>
#include <QSpinBox>
#include <QStackedWidget>
#include <QVBoxLayout>

#include "desktodo/core/AppSettings.hpp"
#include "desktodo/core/Logging.hpp"
#include "desktodo/data/JsonTaskStorage.hpp"

namespace desktodo {
namespace ui {

namespace {
QLabel *pageTitle(const QString &text, QWidget *parent)
{
    auto *title = new QLabel(text, parent);
    QFont titleFont = title->font();
    titleFont.setBold(true);
    title->setFont(titleFont);
    return title;
}
} // namespace

SettingsDialog::SettingsDialog(core::AppSettings &settings, data::JsonTaskStorage &storage, QWidget *parent)
    : QDialog(parent)
    , m_settings(settings)
    , m_storage(storage)
{
    setWindowTitle(tr("Einstellungen"));
    resize(640, 360);
    setupUi();
}

void SettingsDialog::setupUi()
{
    auto *outer = new QVBoxLayout(this);
    outer->setContentsMargins(16, 16, 16, 16);

    auto *layout = new QHBoxLayout();
    layout->setSpacing(12);

    m_categoryList = new QListWidget(this);
    m_categoryList->setSelectionMode(QAbstractItemView::SingleSelection);
    m_categoryList->setFixedWidth(160);
    m_categoryList->addItem(tr("Darstellung"));
    m_categoryList->addItem(tr("Speicher"));

    m_pages = new QStackedWidget(this);
    m_pages->addWidget(createAppearancePage());
    m_pages->addWidget(createStoragePage());

    layout->addWidget(m_categoryList);
    layout->addWidget(m_pages, 1);
    outer->addLayout(layout, 1);

    auto *buttonBox = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel, this);
    connect(buttonBox, &QDialogButtonBox::accepted, this, &QDialog::accept);
    connect(buttonBox, &QDialogButtonBox::rejected, this, &QDialog::reject);
    outer->addWidget(buttonBox);

    connect(m_categoryList, &QListWidget::currentRowChanged, m_pages, &QStackedWidget::setCurrentIndex);
    m_categoryList->setCurrentRow(0);
}

QWidget *SettingsDialog::createAppearancePage()
{
    auto *page = new QWidget(this);
    auto *layout = new QVBoxLayout(page);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(8);
    layout->addWidget(pageTitle(tr("Darstellung"), page));

    auto *form = new QFormLayout();
    m_darkModeCheck = new QCheckBox(tr("Dunkles Farbschema verwenden"), page);
    m_darkModeCheck->setChecked(m_settings.darkMode());
    form->addRow(QString(), m_darkModeCheck);

    m_statusTimeoutSpin = new QSpinBox(page);
    m_statusTimeoutSpin->setRange(500, 30000);
    m_statusTimeoutSpin->setSingleStep(500);
    m_statusTimeoutSpin->setSuffix(tr(" ms"));
    m_statusTimeoutSpin->setValue(m_settings.statusTimeoutMs());
    form->addRow(tr("Statusmeldungen anzeigen für"), m_statusTimeoutSpin);

    layout->addLayout(form);
    layout->addStretch(1);
    return page;
}

QWidget *SettingsDialog::createStoragePage()
{
    auto *page = new QWidget(this);
    auto *layout = new QVBoxLayout(page);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(8);
    layout->addWidget(pageTitle(tr("Speicher"), page));

    auto *pathRow = new QHBoxLayout();
    m_dataFileEdit = new QLineEdit(page);
    m_dataFileEdit->setText(m_settings.dataFile().isEmpty() ? m_storage.filePath() : m_settings.dataFile());
    auto *browseButton = new QPushButton(tr("Durchsuchen…"), page);
    connect(browseButton, &QPushButton::clicked, this, &SettingsDialog::browseDataFile);
    pathRow->addWidget(m_dataFileEdit, 1);
    pathRow->addWidget(browseButton);
    layout->addLayout(pathRow);

    auto *hint = new QLabel(tr("Ein geänderter Speicherort wird beim nächsten Start verwendet."), page);
    hint->setWordWrap(true);
    layout->addWidget(hint);

    m_fileInfoLabel = new QLabel(page);
    m_fileInfoLabel->setWordWrap(true);
    m_fileInfoLabel->setTextInteractionFlags(Qt::TextSelectableByMouse);
    layout->addWidget(m_fileInfoLabel);

    auto *backupButton = new QPushButton(tr("Sicherung erstellen"), page);
    connect(backupButton, &QPushButton::clicked, this, &SettingsDialog::createBackup);
    layout->addWidget(backupButton, 0, Qt::AlignLeft);
    layout->addStretch(1);

    updateFileInfo();
    return page;
}

bool SettingsDialog::darkMode() const
{
    return m_darkModeCheck->isChecked();
}

int SettingsDialog::statusTimeoutMs() const
{
    return m_statusTimeoutSpin->value();
}

QString SettingsDialog::dataFile() const
{
    return m_dataFileEdit->text().trimmed();
}

void SettingsDialog::apply()
{
    m_settings.setDarkMode(darkMode());
    m_settings.setStatusTimeoutMs(statusTimeoutMs());
    const QString path = dataFile();
    if (path != m_storage.filePath() || !m_settings.dataFile().isEmpty()) {
        m_settings.setDataFile(path);
    }
    qCInfo(lcUi) << "Settings applied";
}

void SettingsDialog::browseDataFile()
{
    const QString path = QFileDialog::getSaveFileName(this,
                                                      tr("Speicherort wählen"),
                                                      m_dataFileEdit->text(),
                                                      tr("JSON-Dateien (*.json)"),
                                                      nullptr,
                                                      QFileDialog::DontConfirmOverwrite);
    if (!path.isEmpty()) {
        m_dataFileEdit->setText(path);
    }
}

void SettingsDialog::createBackup()
{
    if (!m_storage.backup()) {
        QMessageBox::warning(this, tr("Sicherung"), m_storage.lastError());
        return;
    }
    const QString message = tr("Sicherung von %1 erstellt").arg(m_storage.filePath());
    QMessageBox::information(this, tr("Sicherung"), message);
    emit backupCreated(message);
}

void SettingsDialog::updateFileInfo()
{
    const data::StorageFileInfo info = m_storage.fileInfo();
    if (!info.exists) {
        m_fileInfoLabel->setText(tr("Aktuelle Datei: %1\n(noch nicht angelegt)").arg(info.path));
        return;
    }
    m_fileInfoLabel->setText(tr("Aktuelle Datei: %1\nGröße: %2 Bytes\nGeändert: %3")
                                 .arg(info.path)
                                 .arg(info.size)
                                 .arg(info.modified.toString(QStringLiteral("yyyy-MM-dd hh:mm:ss"))));
}

} // namespace ui
} // namespace desktodo
