#pragma once

#include <QString>
#include <QStringList>
#include <chrono>

#include "eventually/core/Formatting.hpp"

class QSettings;

namespace eventually {
namespace core {

struct Settings
{
    QStringList calendarFiles;
    std::chrono::milliseconds accessTimeout{5000};
    TitleFormat titleFormat;
    int refreshIntervalSeconds = 60;
    std::chrono::milliseconds lockTimeout{100};
    bool showTitleInTray = true;

    static Settings load(const QSettings &settings);
    void save(QSettings &settings) const;

    // Like load(), but writes the defaults into an empty store so they can be edited.
    static Settings loadOrInitialize(QSettings &settings);

    static QString defaultCalendarFile();
};

} // namespace core
} // namespace eventually
