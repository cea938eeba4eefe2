#include "eventually/cli/CommandLine.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>

namespace eventually {
namespace cli {

namespace {
void setError(QString *errorMessage, const QString &message)
{
    if (errorMessage) {
        *errorMessage = message;
    }
}

const QCommandLineOption &configOption()
{
    static const QCommandLineOption option(QStringList{QStringLiteral("c"), QStringLiteral("config")},
                                           QStringLiteral("Read settings from the INI file <file>."),
                                           QStringLiteral("file"));
    return option;
}

void setupParser(QCommandLineParser &parser, QCommandLineOption &helpOption, QCommandLineOption &versionOption)
{
    parser.setApplicationDescription(QStringLiteral("Menu bar calendar status"));
    parser.setSingleDashWordOptionMode(QCommandLineParser::ParseAsLongOptions);
    helpOption = parser.addHelpOption();
    versionOption = parser.addVersionOption();
    parser.addOption(configOption());
    parser.addPositionalArgument(QStringLiteral("service"),
                                 QStringLiteral("Manage the background service: install, uninstall, start, stop, "
                                                "restart."),
                                 QStringLiteral("[service <action>]"));
}
} // namespace

std::optional<service::ServiceAction> serviceActionFromName(const QString &name)
{
    const QString normalized = name.toLower();
    if (normalized == QLatin1String("install")) {
        return service::ServiceAction::Install;
    }
    if (normalized == QLatin1String("uninstall")) {
        return service::ServiceAction::Uninstall;
    }
    if (normalized == QLatin1String("start")) {
        return service::ServiceAction::Start;
    }
    if (normalized == QLatin1String("stop")) {
        return service::ServiceAction::Stop;
    }
    if (normalized == QLatin1String("restart")) {
        return service::ServiceAction::Restart;
    }
    return std::nullopt;
}

std::optional<CommandLineOptions> parseCommandLine(const QStringList &arguments, QString *errorMessage)
{
    QCommandLineParser parser;
    QCommandLineOption helpOption(QStringLiteral("help"));
    QCommandLineOption versionOption(QStringLiteral("version"));
    setupParser(parser, helpOption, versionOption);

    if (!parser.parse(arguments)) {
        setError(errorMessage, parser.errorText());
        return std::nullopt;
    }

    CommandLineOptions options;
    options.showHelp = parser.isSet(helpOption);
    options.showVersion = parser.isSet(versionOption);
    options.configFile = parser.value(configOption());

    const QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        return options;
    }
    if (positional.first() != QLatin1String("service")) {
        setError(errorMessage, QStringLiteral("Unknown command '%1'").arg(positional.first()));
        return std::nullopt;
    }
    if (positional.size() != 2) {
        setError(errorMessage, QStringLiteral("Usage: service install|uninstall|start|stop|restart"));
        return std::nullopt;
    }
    options.serviceAction = serviceActionFromName(positional.at(1));
    if (!options.serviceAction) {
        setError(errorMessage, QStringLiteral("Unknown service action '%1'").arg(positional.at(1)));
        return std::nullopt;
    }
    return options;
}

QString helpText()
{
    QCommandLineParser parser;
    QCommandLineOption helpOption(QStringLiteral("help"));
    QCommandLineOption versionOption(QStringLiteral("version"));
    setupParser(parser, helpOption, versionOption);
    return parser.helpText();
}

} // namespace cli
} // namespace eventually
