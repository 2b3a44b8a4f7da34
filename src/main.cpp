#include <QApplication>
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QIcon>
#include <QString>

#include "version.h"

#include "desktodo/core/Logging.hpp"
#include "desktodo/ui/MainWindow.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("DeskTodo"));
    QCoreApplication::setApplicationName(QStringLiteral("Desk Todo"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kDeskTodoVersion));

    QApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription(QObject::tr("Desktop-Aufgabenliste mit Kategorien und Erinnerungen"));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption dataFileOption(QStringList{ QStringLiteral("data-file") },
                                            QObject::tr("Aufgabendatei statt data/tasks.json verwenden."),
                                            QObject::tr("pfad"));
    const QCommandLineOption logFileOption(QStringList{ QStringLiteral("log-file") },
                                           QObject::tr("Protokoll zusätzlich in diese Datei schreiben."),
                                           QObject::tr("pfad"));
    const QCommandLineOption darkOption(QStringList{ QStringLiteral("dark") },
                                        QObject::tr("Im Dunkelmodus starten."));
    parser.addOption(dataFileOption);
    parser.addOption(logFileOption);
    parser.addOption(darkOption);
    parser.process(app);

    desktodo::core::initLogging(parser.value(logFileOption));
    qCInfo(lcCore) << "Starting Desk Todo" << kDeskTodoVersion;

    const QIcon appIcon(QStringLiteral(":/icons/app-icon.svg"));
    app.setWindowIcon(appIcon);

    int result = 0;
    {
        desktodo::ui::MainWindow mainWindow(parser.value(dataFileOption));
        mainWindow.setWindowTitle(QObject::tr("Desk Todo %1").arg(QString::fromLatin1(kDeskTodoVersion)));
        mainWindow.setWindowIcon(appIcon);
        if (parser.isSet(darkOption)) {
            mainWindow.setDarkMode(true);
        }
        mainWindow.show();
        mainWindow.reportStartupProblems();
        result = app.exec();
    }

    qCInfo(lcCore) << "Exiting with code" << result;
    desktodo::core::shutdownLogging();
    return result;
}
