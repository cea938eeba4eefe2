#pragma once

#include <QString>
#include <optional>

namespace eventually {
namespace core {

enum class Service {
    Slack,
    Zoom,
    GoogleMeet,
    MicrosoftTeams,
    Generic
};

QString serviceName(Service service);
QString serviceIcon(Service service);

Service detectService(const QString &url);

// The location itself when it is an http(s) URL.
std::optional<QString> extractUrl(const std::optional<QString> &location);

// slack://join-huddle deep link for .../huddle/<team>/<channel> URLs.
std::optional<QString> slackHuddleLink(const QString &url);

} // namespace core
} // namespace eventually
