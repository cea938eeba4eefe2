#pragma once

#include <QString>
#include <QStringList>
#include <optional>

#include "eventually/service/ServiceManager.hpp"

namespace eventually {
namespace cli {

struct CommandLineOptions
{
    QString configFile;
    std::optional<service::ServiceAction> serviceAction;
    bool showHelp = false;
    bool showVersion = false;
};

// Parses argv (program name first). std::nullopt and an error message on
// invalid arguments.
std::optional<CommandLineOptions> parseCommandLine(const QStringList &arguments, QString *errorMessage = nullptr);

QString helpText();

std::optional<service::ServiceAction> serviceActionFromName(const QString &name);

} // namespace cli
} // namespace eventually
