#include "eventually/service/ServiceManager.hpp"

#include "eventually/core/Logging.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QProcess>
#include <QSaveFile>
#include <QTextStream>

namespace eventually {
namespace service {

namespace {
constexpr int PROCESS_TIMEOUT_MS = 30000;

void setError(QString *errorMessage, const QString &message)
{
    if (errorMessage) {
        *errorMessage = message;
    }
}

bool ensureParentDir(const QString &filePath, QString *errorMessage)
{
    const QDir dir = QFileInfo(filePath).dir();
    if (dir.exists() || dir.mkpath(QStringLiteral("."))) {
        return true;
    }
    setError(errorMessage, QStringLiteral("Cannot create directory %1").arg(dir.absolutePath()));
    return false;
}
} // namespace

Supervisor defaultSupervisor()
{
#ifdef Q_OS_MACOS
    return Supervisor::Launchd;
#else
    return Supervisor::Systemd;
#endif
}

CommandRunner processRunner()
{
    return [](const QString &program, const QStringList &arguments) {
        CommandOutput output;
        QProcess process;
        process.start(program, arguments);
        output.started = process.waitForStarted();
        if (!output.started) {
            output.standardError = process.errorString();
            return output;
        }
        if (!process.waitForFinished(PROCESS_TIMEOUT_MS)) {
            process.kill();
            process.waitForFinished();
            output.standardError = QStringLiteral("%1 timed out").arg(program);
            return output;
        }
        output.exitCode = process.exitStatus() == QProcess::NormalExit ? process.exitCode() : -1;
        output.standardError = QString::fromLocal8Bit(process.readAllStandardError());
        return output;
    };
}

ServiceManager::ServiceManager(QString label,
                               QString binaryPath,
                               Supervisor supervisor,
                               QString homeDir,
                               CommandRunner runner)
    : m_label(std::move(label))
    , m_binaryPath(std::move(binaryPath))
    , m_supervisor(supervisor)
    , m_homeDir(homeDir.isEmpty() ? QDir::homePath() : std::move(homeDir))
    , m_runner(std::move(runner))
{
}

QString ServiceManager::descriptorPath() const
{
    const QDir home(m_homeDir);
    switch (m_supervisor) {
    case Supervisor::Launchd:
        return home.filePath(QStringLiteral("Library/LaunchAgents/%1.plist").arg(m_label));
    case Supervisor::Systemd:
    default:
        return home.filePath(QStringLiteral(".config/systemd/user/%1.service").arg(m_label));
    }
}

QString ServiceManager::logPath(const QString &kind) const
{
    const QDir home(m_homeDir);
    switch (m_supervisor) {
    case Supervisor::Launchd:
        return home.filePath(QStringLiteral("Library/Logs/eventually.%1").arg(kind));
    case Supervisor::Systemd:
    default:
        return home.filePath(QStringLiteral(".local/state/eventually/eventually.%1").arg(kind));
    }
}

QString ServiceManager::descriptor() const
{
    return m_supervisor == Supervisor::Launchd ? launchdPlist() : systemdUnit();
}

bool ServiceManager::isInstalled() const
{
    return QFileInfo::exists(descriptorPath());
}

bool ServiceManager::install(QString *errorMessage) const
{
    const QString path = descriptorPath();
    if (isInstalled()) {
        qCInfo(EVENTUALLY_SERVICE_LOG).noquote()
            << QStringLiteral("existing service descriptor detected at `%1`, skipping installation").arg(path);
        return true;
    }

    if (!ensureParentDir(path, errorMessage) || !ensureParentDir(logPath(QStringLiteral("log")), errorMessage)) {
        return false;
    }

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        setError(errorMessage, QStringLiteral("Cannot write %1: %2").arg(path, file.errorString()));
        return false;
    }
    QTextStream stream(&file);
    stream.setCodec("UTF-8");
    stream << descriptor();
    stream.flush();
    if (!file.commit()) {
        setError(errorMessage, QStringLiteral("Cannot write %1: %2").arg(path, file.errorString()));
        return false;
    }

    qCInfo(EVENTUALLY_SERVICE_LOG).noquote() << QStringLiteral("installed service descriptor to `%1`").arg(path);
    return true;
}

bool ServiceManager::uninstall(QString *errorMessage) const
{
    const QString path = descriptorPath();
    if (!isInstalled()) {
        qCInfo(EVENTUALLY_SERVICE_LOG).noquote()
            << QStringLiteral("no service descriptor detected at `%1`, skipping uninstallation").arg(path);
        return true;
    }

    QString stopError;
    if (!stop(&stopError)) {
        qCWarning(EVENTUALLY_SERVICE_LOG).noquote() << QStringLiteral("failed to stop service: %1").arg(stopError);
    }

    if (!QFile::remove(path)) {
        setError(errorMessage, QStringLiteral("Cannot remove %1").arg(path));
        return false;
    }
    qCInfo(EVENTUALLY_SERVICE_LOG).noquote() << QStringLiteral("removed service descriptor at `%1`").arg(path);
    return true;
}

bool ServiceManager::start(QString *errorMessage) const
{
    if (!isInstalled() && !install(errorMessage)) {
        return false;
    }

    qCInfo(EVENTUALLY_SERVICE_LOG) << "starting service...";
    const CommandOutput output = m_runner(supervisorProgram(), loadArguments());
    if (!output.started) {
        setError(errorMessage, QStringLiteral("Failed to run %1: %2").arg(supervisorProgram(), output.standardError));
        return false;
    }
    if (output.exitCode != 0) {
        if (output.standardError.contains(QLatin1String("already loaded"))) {
            qCInfo(EVENTUALLY_SERVICE_LOG) << "service already running";
            return true;
        }
        setError(errorMessage, QStringLiteral("Failed to start service: %1").arg(output.standardError.trimmed()));
        return false;
    }

    qCInfo(EVENTUALLY_SERVICE_LOG) << "service started";
    return true;
}

bool ServiceManager::stop(QString *errorMessage) const
{
    qCInfo(EVENTUALLY_SERVICE_LOG) << "stopping service...";
    const CommandOutput output = m_runner(supervisorProgram(), unloadArguments());
    if (!output.started) {
        setError(errorMessage, QStringLiteral("Failed to run %1: %2").arg(supervisorProgram(), output.standardError));
        return false;
    }
    if (output.exitCode != 0) {
        if (output.standardError.contains(QLatin1String("Could not find"))
            || output.standardError.contains(QLatin1String("not loaded"))) {
            qCInfo(EVENTUALLY_SERVICE_LOG) << "service not running";
            return true;
        }
        setError(errorMessage, QStringLiteral("Failed to stop service: %1").arg(output.standardError.trimmed()));
        return false;
    }

    qCInfo(EVENTUALLY_SERVICE_LOG) << "service stopped";
    return true;
}

bool ServiceManager::restart(QString *errorMessage) const
{
    return stop(errorMessage) && start(errorMessage);
}

bool ServiceManager::execute(ServiceAction action, QString *errorMessage) const
{
    switch (action) {
    case ServiceAction::Install:
        return install(errorMessage);
    case ServiceAction::Uninstall:
        return uninstall(errorMessage);
    case ServiceAction::Start:
        return start(errorMessage);
    case ServiceAction::Stop:
        return stop(errorMessage);
    case ServiceAction::Restart:
        return restart(errorMessage);
    }
    setError(errorMessage, QStringLiteral("Unknown service action"));
    return false;
}

QString ServiceManager::launchdPlist() const
{
    return QStringLiteral(R"(<?xml version="1.0" encoding="UTF-8"?>
<!DOCTYPE plist PUBLIC "-//Apple//DTD PLIST 1.0//EN" "http://www.apple.com/DTDs/PropertyList-1.0.dtd">
<plist version="1.0">
<dict>
    <key>Label</key>
    <string>%1</string>
    <key>ProgramArguments</key>
    <array>
        <string>%2</string>
    </array>
    <key>RunAtLoad</key>
    <true/>
    <key>KeepAlive</key>
    <true/>
    <key>StandardOutPath</key>
    <string>%3</string>
    <key>StandardErrorPath</key>
    <string>%4</string>
</dict>
</plist>
)")
        .arg(m_label.toHtmlEscaped(), m_binaryPath.toHtmlEscaped(), logPath(QStringLiteral("log")).toHtmlEscaped(),
             logPath(QStringLiteral("err")).toHtmlEscaped());
}

QString ServiceManager::systemdUnit() const
{
    return QStringLiteral(R"([Unit]
Description=Eventually calendar status (%1)
After=graphical-session.target
PartOf=graphical-session.target

[Service]
ExecStart="%2"
Restart=always
StandardOutput=append:%3
StandardError=append:%4

[Install]
WantedBy=graphical-session.target
)")
        .arg(m_label, m_binaryPath, logPath(QStringLiteral("log")), logPath(QStringLiteral("err")));
}

QStringList ServiceManager::loadArguments() const
{
    if (m_supervisor == Supervisor::Launchd) {
        return {QStringLiteral("load"), descriptorPath()};
    }
    return {QStringLiteral("--user"), QStringLiteral("enable"), QStringLiteral("--now"),
            QFileInfo(descriptorPath()).fileName()};
}

QStringList ServiceManager::unloadArguments() const
{
    if (m_supervisor == Supervisor::Launchd) {
        return {QStringLiteral("unload"), descriptorPath()};
    }
    return {QStringLiteral("--user"), QStringLiteral("disable"), QStringLiteral("--now"),
            QFileInfo(descriptorPath()).fileName()};
}

QString ServiceManager::supervisorProgram() const
{
    return m_supervisor == Supervisor::Launchd ? QStringLiteral("launchctl") : QStringLiteral("systemctl");
}

} // namespace service
} // namespace eventually
