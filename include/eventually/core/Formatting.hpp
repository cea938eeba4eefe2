#pragma once

#include <QDateTime>
#include <QString>

namespace eventually {
namespace core {

enum class HourRounding {
    Floor,
    Nearest
};

struct TitleFormat
{
    int maxLength = 30;
    HourRounding rounding = HourRounding::Floor;
};

enum class StatusTemplate {
    TimeLeft,
    StartsIn
};

constexpr int kEndOfDaySeconds = 86399;

QString formatTime(const QDateTime &dt);

// All-day events start at midnight and end at 23:59:59.
bool isAllDay(const QDateTime &start, const QDateTime &end);

// "45m" up to an hour, whole hours beyond.
QString formatTimeLabel(qint64 minutes, HourRounding rounding = HourRounding::Floor);

// Number of Unicode scalar values, not UTF-16 units.
int characterCount(const QString &text);

QString truncateTitle(const QString &title, int maxLength);

QString formatStatusTitle(const QString &title, qint64 seconds, StatusTemplate kind, const TitleFormat &format);

} // namespace core
} // namespace eventually
