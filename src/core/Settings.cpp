#include "eventually/core/Settings.hpp"

#include "eventually/core/Logging.hpp"

#include <QDir>
#include <QSettings>
#include <QStandardPaths>

namespace eventually {
namespace core {

namespace {
const QString KEY_CALENDAR_FILES = QStringLiteral("calendar/files");
const QString KEY_ACCESS_TIMEOUT = QStringLiteral("calendar/accessTimeoutMs");
const QString KEY_MAX_TITLE_LENGTH = QStringLiteral("status/maxTitleLength");
const QString KEY_HOUR_ROUNDING = QStringLiteral("status/hourRounding");
const QString KEY_REFRESH_INTERVAL = QStringLiteral("status/refreshIntervalSeconds");
const QString KEY_LOCK_TIMEOUT = QStringLiteral("core/lockTimeoutMs");
const QString KEY_SHOW_TITLE = QStringLiteral("tray/showTitle");

HourRounding roundingFromString(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("nearest")) {
        return HourRounding::Nearest;
    }
    if (!normalized.isEmpty() && normalized != QLatin1String("floor")) {
        qCWarning(EVENTUALLY_CORE_LOG) << "Settings::load: unknown hour rounding" << value << "using floor";
    }
    return HourRounding::Floor;
}

QString roundingToString(HourRounding rounding)
{
    return rounding == HourRounding::Nearest ? QStringLiteral("nearest") : QStringLiteral("floor");
}
} // namespace

Settings Settings::load(const QSettings &settings)
{
    Settings result;

    QStringList files = settings.value(KEY_CALENDAR_FILES).toStringList();
    files.removeAll(QString());
    result.calendarFiles = files.isEmpty() ? QStringList{defaultCalendarFile()} : files;

    result.accessTimeout = std::chrono::milliseconds(
        qMax(0, settings.value(KEY_ACCESS_TIMEOUT, static_cast<int>(result.accessTimeout.count())).toInt()));
    result.titleFormat.maxLength = qMax(1, settings.value(KEY_MAX_TITLE_LENGTH, result.titleFormat.maxLength).toInt());
    result.titleFormat.rounding = roundingFromString(settings.value(KEY_HOUR_ROUNDING).toString());
    result.refreshIntervalSeconds = qBound(5, settings.value(KEY_REFRESH_INTERVAL, result.refreshIntervalSeconds).toInt(),
                                           3600);
    result.lockTimeout = std::chrono::milliseconds(
        qMax(1, settings.value(KEY_LOCK_TIMEOUT, static_cast<int>(result.lockTimeout.count())).toInt()));
    result.showTitleInTray = settings.value(KEY_SHOW_TITLE, result.showTitleInTray).toBool();
    return result;
}

void Settings::save(QSettings &settings) const
{
    settings.setValue(KEY_CALENDAR_FILES, calendarFiles);
    settings.setValue(KEY_ACCESS_TIMEOUT, static_cast<int>(accessTimeout.count()));
    settings.setValue(KEY_MAX_TITLE_LENGTH, titleFormat.maxLength);
    settings.setValue(KEY_HOUR_ROUNDING, roundingToString(titleFormat.rounding));
    settings.setValue(KEY_REFRESH_INTERVAL, refreshIntervalSeconds);
    settings.setValue(KEY_LOCK_TIMEOUT, static_cast<int>(lockTimeout.count()));
    settings.setValue(KEY_SHOW_TITLE, showTitleInTray);
}

Settings Settings::loadOrInitialize(QSettings &settings)
{
    const Settings result = load(settings);
    if (settings.allKeys().isEmpty()) {
        qCInfo(EVENTUALLY_CORE_LOG) << "Settings::loadOrInitialize: writing defaults to" << settings.fileName();
        result.save(settings);
        settings.sync();
        if (settings.status() != QSettings::NoError) {
            qCWarning(EVENTUALLY_CORE_LOG) << "Settings::loadOrInitialize: cannot write" << settings.fileName();
        }
    }
    return result;
}

QString Settings::defaultCalendarFile()
{
    QString storageFolder = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (storageFolder.isEmpty()) {
        storageFolder = QDir::homePath() + QStringLiteral("/.local/share/eventually");
    }
    return QDir(storageFolder).filePath(QStringLiteral("calendar.ics"));
}

} // namespace core
} // namespace eventually
