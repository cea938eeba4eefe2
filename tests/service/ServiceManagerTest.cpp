#include <QtTest/QtTest>

#include "eventually/service/ServiceManager.hpp"

#include <QTemporaryDir>

using namespace eventually;

namespace {
const QString LABEL = QStringLiteral("io.eventually.tray");
const QString BINARY = QStringLiteral("/opt/eventually/bin/eventually");

struct FakeSupervisor
{
    QStringList calls;
    service::CommandOutput reply{true, 0, QString()};

    service::CommandRunner runner()
    {
        return [this](const QString &program, const QStringList &arguments) {
            calls << (program + QLatin1Char(' ') + arguments.join(QLatin1Char(' ')));
            return reply;
        };
    }
};
} // namespace

class ServiceManagerTest : public QObject
{
    Q_OBJECT

private slots:
    void computesLaunchdPaths();
    void computesSystemdPaths();
    void writesLaunchdPlist();
    void writesSystemdUnit();
    void installSkipsExistingDescriptor();
    void startInstallsAndLoads();
    void startToleratesAlreadyLoaded();
    void startReportsFailures();
    void stopToleratesMissingService();
    void uninstallStopsAndRemoves();
    void uninstallSkipsMissingDescriptor();
    void restartStopsThenStarts();
    void executeDispatchesActions();
};

void ServiceManagerTest::computesLaunchdPaths()
{
    QTemporaryDir home;
    QVERIFY(home.isValid());
    FakeSupervisor fake;
    service::ServiceManager manager(LABEL, BINARY, service::Supervisor::Launchd, home.path(), fake.runner());

    QCOMPARE(manager.descriptorPath(), home.filePath(QStringLiteral("Library/LaunchAgents/io.eventually.tray.plist")));
    QCOMPARE(manager.logPath(QStringLiteral("log")), home.filePath(QStringLiteral("Library/Logs/eventually.log")));
    QCOMPARE(manager.logPath(QStringLiteral("err")), home.filePath(QStringLiteral("Library/Logs/eventually.err")));
    QVERIFY(!manager.isInstalled());
}

void ServiceManagerTest::computesSystemdPaths()
{
    QTemporaryDir home;
    QVERIFY(home.isValid());
    FakeSupervisor fake;
    service::ServiceManager manager(LABEL, BINARY, service::Supervisor::Systemd, home.path(), fake.runner());

    QCOMPARE(manager.descriptorPath(), home.filePath(QStringLiteral(".config/systemd/user/io.eventually.tray.service")));
    QCOMPARE(manager.logPath(QStringLiteral("log")),
             home.filePath(QStringLiteral(".local/state/eventually/eventually.log")));
}

void ServiceManagerTest::writesLaunchdPlist()
{
    QTemporaryDir home;
    QVERIFY(home.isValid());
    FakeSupervisor fake;
    service::ServiceManager manager(LABEL, BINARY, service::Supervisor::Launchd, home.path(), fake.runner());

    QString error;
    QVERIFY2(manager.install(&error), qPrintable(error));
    QVERIFY(manager.isInstalled());
    QVERIFY(fake.calls.isEmpty());
    QVERIFY(QFileInfo(manager.logPath(QStringLiteral("log"))).dir().exists());

    QFile file(manager.descriptorPath());
    QVERIFY(file.open(QIODevice::ReadOnly | QIODevice::Text));
    const QString plist = QString::fromUtf8(file.readAll());
    QVERIFY(plist.contains(QStringLiteral("<string>io.eventually.tray</string>")));
    QVERIFY(plist.contains(QStringLiteral("<string>/opt/eventually/bin/eventually</string>")));
    QVERIFY(plist.contains(QStringLiteral("<key>RunAtLoad</key>")));
    QVERIFY(plist.contains(QStringLiteral("<key>KeepAlive</key>")));
    QVERIFY(plist.contains(manager.logPath(QStringLiteral("err"))));
}

void ServiceManagerTest::writesSystemdUnit()
{
    QTemporaryDir home;
    QVERIFY(home.isValid());
    FakeSupervisor fake;
    service::ServiceManager manager(LABEL, BINARY, service::Supervisor::Systemd, home.path(), fake.runner());

    const QString unit = manager.descriptor();
    QVERIFY(unit.contains(QStringLiteral("ExecStart=\"/opt/eventually/bin/eventually\"")));
    QVERIFY(unit.contains(QStringLiteral("Restart=always")));
    QVERIFY(unit.contains(QStringLiteral("StandardError=append:") + manager.logPath(QStringLiteral("err"))));
}

void ServiceManagerTest::installSkipsExistingDescriptor()
{
    QTemporaryDir home;
    QVERIFY(home.isValid());
    FakeSupervisor fake;
    service::ServiceManager manager(LABEL, BINARY, service::Supervisor::Launchd, home.path(), fake.runner());

    QVERIFY(QDir(home.path()).mkpath(QStringLiteral("Library/LaunchAgents")));
    {
        QFile file(manager.descriptorPath());
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("custom");
    }

    QVERIFY(manager.install());
    QFile file(manager.descriptorPath());
    QVERIFY(file.open(QIODevice::ReadOnly));
    QCOMPARE(file.readAll(), QByteArray("custom"));
}

void ServiceManagerTest::startInstallsAndLoads()
{
    QTemporaryDir home;
    QVERIFY(home.isValid());
    FakeSupervisor fake;
    service::ServiceManager manager(LABEL, BINARY, service::Supervisor::Launchd, home.path(), fake.runner());

    QVERIFY(manager.start());
    QVERIFY(manager.isInstalled());
    QCOMPARE(fake.calls, QStringList{QStringLiteral("launchctl load ") + manager.descriptorPath()});

    FakeSupervisor systemd;
    service::ServiceManager userUnit(LABEL, BINARY, service::Supervisor::Systemd, home.path(), systemd.runner());
    QVERIFY(userUnit.start());
    QCOMPARE(systemd.calls, QStringList{QStringLiteral("systemctl --user enable --now io.eventually.tray.service")});
}

void ServiceManagerTest::startToleratesAlreadyLoaded()
{
    QTemporaryDir home;
    QVERIFY(home.isValid());
    FakeSupervisor fake;
    fake.reply = {true, 1, QStringLiteral("service already loaded")};
    service::ServiceManager manager(LABEL, BINARY, service::Supervisor::Launchd, home.path(), fake.runner());

    QString error;
    QVERIFY(manager.start(&error));
    QVERIFY(error.isEmpty());
}

void ServiceManagerTest::startReportsFailures()
{
    QTemporaryDir home;
    QVERIFY(home.isValid());
    FakeSupervisor fake;
    fake.reply = {true, 5, QStringLiteral("Input/output error\n")};
    service::ServiceManager manager(LABEL, BINARY, service::Supervisor::Launchd, home.path(), fake.runner());

    QString error;
    QVERIFY(!manager.start(&error));
    QCOMPARE(error, QStringLiteral("Failed to start service: Input/output error"));

    fake.reply = {false, -1, QStringLiteral("No such file or directory")};
    QVERIFY(!manager.start(&error));
    QCOMPARE(error, QStringLiteral("Failed to run launchctl: No such file or directory"));
}

void ServiceManagerTest::stopToleratesMissingService()
{
    QTemporaryDir home;
    QVERIFY(home.isValid());
    FakeSupervisor fake;
    fake.reply = {true, 1, QStringLiteral("Could not find specified service")};
    service::ServiceManager manager(LABEL, BINARY, service::Supervisor::Launchd, home.path(), fake.runner());

    QVERIFY(manager.stop());
    QCOMPARE(fake.calls, QStringList{QStringLiteral("launchctl unload ") + manager.descriptorPath()});

    fake.reply = {true, 1, QStringLiteral("Permission denied")};
    QString error;
    QVERIFY(!manager.stop(&error));
    QCOMPARE(error, QStringLiteral("Failed to stop service: Permission denied"));
}

void ServiceManagerTest::uninstallStopsAndRemoves()
{
    QTemporaryDir home;
    QVERIFY(home.isValid());
    FakeSupervisor fake;
    service::ServiceManager manager(LABEL, BINARY, service::Supervisor::Systemd, home.path(), fake.runner());
    QVERIFY(manager.install());

    // A failing stop does not block the removal.
    fake.reply = {true, 1, QStringLiteral("Access denied")};
    QVERIFY(manager.uninstall());
    QVERIFY(!manager.isInstalled());
    QCOMPARE(fake.calls, QStringList{QStringLiteral("systemctl --user disable --now io.eventually.tray.service")});
}

void ServiceManagerTest::uninstallSkipsMissingDescriptor()
{
    QTemporaryDir home;
    QVERIFY(home.isValid());
    FakeSupervisor fake;
    service::ServiceManager manager(LABEL, BINARY, service::Supervisor::Launchd, home.path(), fake.runner());

    QVERIFY(manager.uninstall());
    QVERIFY(fake.calls.isEmpty());
}

void ServiceManagerTest::restartStopsThenStarts()
{
    QTemporaryDir home;
    QVERIFY(home.isValid());
    FakeSupervisor fake;
    service::ServiceManager manager(LABEL, BINARY, service::Supervisor::Launchd, home.path(), fake.runner());

    QVERIFY(manager.restart());
    QCOMPARE(fake.calls.size(), 2);
    QVERIFY(fake.calls.at(0).startsWith(QStringLiteral("launchctl unload")));
    QVERIFY(fake.calls.at(1).startsWith(QStringLiteral("launchctl load")));
}

void ServiceManagerTest::executeDispatchesActions()
{
    QTemporaryDir home;
    QVERIFY(home.isValid());
    FakeSupervisor fake;
    service::ServiceManager manager(LABEL, BINARY, service::Supervisor::Launchd, home.path(), fake.runner());

    QVERIFY(manager.execute(service::ServiceAction::Install));
    QVERIFY(manager.isInstalled());
    QVERIFY(fake.calls.isEmpty());

    QVERIFY(manager.execute(service::ServiceAction::Stop));
    QCOMPARE(fake.calls.size(), 1);

    QVERIFY(manager.execute(service::ServiceAction::Uninstall));
    QVERIFY(!manager.isInstalled());
}

QTEST_GUILESS_MAIN(ServiceManagerTest)
#include "ServiceManagerTest.moc"
