#include <QApplication>
#include <QCoreApplication>
#include <QIcon>
#include <QSettings>
#include <QString>
#include <QSystemTrayIcon>
#include <QTextStream>
#include <memory>

#include "version.h"

#include "eventually/cli/CommandLine.hpp"
#include "eventually/core/AccessRequest.hpp"
#include "eventually/core/AppContext.hpp"
#include "eventually/core/Errors.hpp"
#include "eventually/core/Logging.hpp"
#include "eventually/core/Settings.hpp"
#include "eventually/service/ServiceManager.hpp"
#include "eventually/ui/TrayController.hpp"

namespace {
const QString SERVICE_LABEL = QStringLiteral("io.eventually.tray");

void setupApplicationInfo()
{
    QCoreApplication::setOrganizationName(QStringLiteral("Eventually"));
    QCoreApplication::setOrganizationDomain(QStringLiteral("eventually.io"));
    QCoreApplication::setApplicationName(QStringLiteral("eventually"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kEventuallyVersion));
}

std::unique_ptr<QSettings> openSettings(const QString &configFile)
{
    if (configFile.isEmpty()) {
        return std::make_unique<QSettings>();
    }
    return std::make_unique<QSettings>(configFile, QSettings::IniFormat);
}

int runServiceCommand(int argc, char *argv[], eventually::service::ServiceAction action)
{
    QCoreApplication app(argc, argv);
    const eventually::service::ServiceManager manager(SERVICE_LABEL, QCoreApplication::applicationFilePath());
    QString error;
    if (!manager.execute(action, &error)) {
        QTextStream(stderr) << "Command failed: " << error << '\n';
        return 1;
    }
    return 0;
}
} // namespace

int main(int argc, char *argv[])
{
    setupApplicationInfo();

    QStringList arguments;
    for (int i = 0; i < argc; ++i) {
        arguments << QString::fromLocal8Bit(argv[i]);
    }

    QString parseError;
    const auto options = eventually::cli::parseCommandLine(arguments, &parseError);
    if (!options) {
        QTextStream(stderr) << parseError << '\n';
        return 1;
    }
    if (options->showHelp || options->showVersion) {
        QCoreApplication app(argc, argv);
        if (options->showHelp) {
            QTextStream(stdout) << eventually::cli::helpText();
        } else {
            QTextStream(stdout) << QCoreApplication::applicationName() << ' ' << kEventuallyVersion << '\n';
        }
        return 0;
    }
    if (options->serviceAction) {
        return runServiceCommand(argc, argv, *options->serviceAction);
    }

    QApplication app(argc, argv);
    app.setQuitOnLastWindowClosed(false);
    app.setWindowIcon(QIcon(QStringLiteral(":/icons/app-icon.svg")));

    if (!QSystemTrayIcon::isSystemTrayAvailable()) {
        qCCritical(EVENTUALLY_UI_LOG) << "System tray not available. Exiting.";
        return 1;
    }

    const auto settingsStore = openSettings(options->configFile);
    eventually::core::AppContext context(eventually::core::Settings::loadOrInitialize(*settingsStore));

    if (!eventually::core::requestAccessBlocking(context.eventSource(), context.settings().accessTimeout)) {
        QTextStream(stderr) << eventually::core::errorMessage(eventually::core::CalendarError::AccessDenied)
                            << ". Please grant access to the calendar files ("
                            << context.settings().calendarFiles.join(QStringLiteral(", "))
                            << "), or on macOS in System Settings > Privacy & Security > Calendars\n";
        return 1;
    }

    eventually::ui::TrayController tray(context);
    tray.show();

    return app.exec();
}
