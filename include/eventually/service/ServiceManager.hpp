#pragma once

#include <QString>
#include <QStringList>
#include <functional>

namespace eventually {
namespace service {

enum class Supervisor {
    Launchd,
    Systemd
};

enum class ServiceAction {
    Install,
    Uninstall,
    Start,
    Stop,
    Restart
};

struct CommandOutput
{
    bool started = false;
    int exitCode = -1;
    QString standardError;
};

// Runs the process supervisor's command line tool.
using CommandRunner = std::function<CommandOutput(const QString &program, const QStringList &arguments)>;

Supervisor defaultSupervisor();
CommandRunner processRunner();

// Installs the application as a per-user background service: writes the
// supervisor's descriptor file and loads or unloads it.
class ServiceManager
{
public:
    ServiceManager(QString label,
                   QString binaryPath,
                   Supervisor supervisor = defaultSupervisor(),
                   QString homeDir = QString(),
                   CommandRunner runner = processRunner());

    QString descriptorPath() const;
    QString logPath(const QString &kind) const;
    QString descriptor() const;
    bool isInstalled() const;

    bool install(QString *errorMessage = nullptr) const;
    bool uninstall(QString *errorMessage = nullptr) const;
    bool start(QString *errorMessage = nullptr) const;
    bool stop(QString *errorMessage = nullptr) const;
    bool restart(QString *errorMessage = nullptr) const;

    bool execute(ServiceAction action, QString *errorMessage = nullptr) const;

private:
    QString launchdPlist() const;
    QString systemdUnit() const;
    QStringList loadArguments() const;
    QStringList unloadArguments() const;
    QString supervisorProgram() const;

    QString m_label;
    QString m_binaryPath;
    Supervisor m_supervisor;
    QString m_homeDir;
    CommandRunner m_runner;
};

} // namespace service
} // namespace eventually
