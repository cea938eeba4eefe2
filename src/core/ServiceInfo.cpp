#include "eventually/core/ServiceInfo.hpp"

#include <QStringList>
#include <array>
#include <utility>

namespace eventually {
namespace core {

namespace {
// Checked in order; the first fragment found wins.
const std::array<std::pair<const char *, Service>, 5> SERVICE_FRAGMENTS = {{
    {"slack.com", Service::Slack},
    {"zoom.us", Service::Zoom},
    {"meet.google", Service::GoogleMeet},
    {"teams.microsoft.com", Service::MicrosoftTeams},
    {"teams.live.com", Service::MicrosoftTeams},
}};
} // namespace

QString serviceName(Service service)
{
    switch (service) {
    case Service::Slack:
        return QStringLiteral("Slack");
    case Service::Zoom:
        return QStringLiteral("Zoom");
    case Service::GoogleMeet:
        return QStringLiteral("Google Meet");
    case Service::MicrosoftTeams:
        return QStringLiteral("Teams");
    case Service::Generic:
    default:
        return QStringLiteral("Video Call");
    }
}

QString serviceIcon(Service service)
{
    switch (service) {
    case Service::Slack:
        return QStringLiteral("slack");
    case Service::Zoom:
        return QStringLiteral("zoom");
    case Service::GoogleMeet:
        return QStringLiteral("google");
    case Service::MicrosoftTeams:
        return QStringLiteral("teams");
    case Service::Generic:
    default:
        return QStringLiteral("video");
    }
}

Service detectService(const QString &url)
{
    for (const auto &entry : SERVICE_FRAGMENTS) {
        if (url.contains(QLatin1String(entry.first))) {
            return entry.second;
        }
    }
    return Service::Generic;
}

std::optional<QString> extractUrl(const std::optional<QString> &location)
{
    if (!location) {
        return std::nullopt;
    }
    if (location->startsWith(QLatin1String("http://")) || location->startsWith(QLatin1String("https://"))) {
        return location;
    }
    return std::nullopt;
}

std::optional<QString> slackHuddleLink(const QString &url)
{
    if (!url.contains(QLatin1String("/huddle/"))) {
        return std::nullopt;
    }
    const QStringList parts = url.split('/');
    const int huddleIndex = parts.indexOf(QStringLiteral("huddle"));
    if (huddleIndex < 0 || huddleIndex + 2 >= parts.size()) {
        return std::nullopt;
    }
    return QStringLiteral("slack://join-huddle?team=%1&id=%2").arg(parts.at(huddleIndex + 1), parts.at(huddleIndex + 2));
}

} // namespace core
} // namespace eventually
