#pragma once

#include <QDialog>

class QCheckBox;
class QLabel;
class QLineEdit;
class QListWidget;
class QSpinBox;
class QStackedWidget;

namespace desktodo {
namespace data {
class JsonTaskStorage;
}

namespace core {
class AppSettings;
}

namespace ui {

class SettingsDialog : public QDialog
{
    Q_OBJECT

public:
    SettingsDialog(core::AppSettings &settings, data::JsonTaskStorage &storage, QWidget *parent = nullptr);

    bool darkMode() const;
    int statusTimeoutMs() const;
    QString dataFile() const;

    // Writes the edited values back to AppSettings.
    void apply();

signals:
    void backupCreated(const QString &message);

private:
    void setupUi();
    QWidget *createAppearancePage();
    QWidget *createStoragePage();
    void browseDataFile();
    void createBackup();
    void updateFileInfo();

    core::AppSettings &m_settings;
    data::JsonTaskStorage &m_storage;
    QListWidget *m_categoryList = nullptr;
    QStackedWidget *m_pages = nullptr;
    QCheckBox *m_darkModeCheck = nullptr;
    QSpinBox *m_statusTimeoutSpin = nullptr;
    QLineEdit *m_dataFileEdit = nullptr;
    QLabel *m_fileInfoLabel = nullptr;
};

} // namespace ui
} // namespace desktodo
