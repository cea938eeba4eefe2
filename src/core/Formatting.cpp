#include "eventually/core/Formatting.hpp"

#include <QTime>
#include <QVector>

namespace eventually {
namespace core {

namespace {
const QChar ELLIPSIS(0x2026);

QString templateFor(StatusTemplate kind)
{
    switch (kind) {
    case StatusTemplate::TimeLeft:
        return QStringLiteral("%1 • %2 left");
    case StatusTemplate::StartsIn:
    default:
        return QStringLiteral("%1 • in %2");
    }
}
} // namespace

QString formatTime(const QDateTime &dt)
{
    return dt.time().toString(QStringLiteral("hh:mm"));
}

bool isAllDay(const QDateTime &start, const QDateTime &end)
{
    return QTime(0, 0).secsTo(start.time()) == 0 && QTime(0, 0).secsTo(end.time()) == kEndOfDaySeconds;
}

QString formatTimeLabel(qint64 minutes, HourRounding rounding)
{
    if (minutes <= 60) {
        return QStringLiteral("%1m").arg(minutes);
    }
    qint64 hours = minutes / 60;
    if (rounding == HourRounding::Nearest && minutes % 60 >= 30) {
        ++hours;
    }
    return QStringLiteral("%1h").arg(hours);
}

int characterCount(const QString &text)
{
    return text.toUcs4().size();
}

QString truncateTitle(const QString &title, int maxLength)
{
    const QVector<uint> scalars = title.toUcs4();
    if (scalars.size() <= maxLength) {
        return title;
    }
    if (maxLength <= 0) {
        return {};
    }
    QString truncated = QString::fromUcs4(scalars.constData(), maxLength - 1);
    truncated.append(ELLIPSIS);
    return truncated;
}

QString formatStatusTitle(const QString &title, qint64 seconds, StatusTemplate kind, const TitleFormat &format)
{
    const QString timeLabel = formatTimeLabel(seconds / 60, format.rounding);
    const QString pattern = templateFor(kind);

    // "%1" and "%2" are placeholders, not rendered characters.
    const int overhead = characterCount(pattern) - 4 + characterCount(timeLabel);
    const int maxTitleLength = qMax(0, format.maxLength - overhead);

    return pattern.arg(truncateTitle(title, maxTitleLength), timeLabel);
}

} // namespace core
} // namespace eventually
