#include "eventually/data/IcsEventSource.hpp"

#include "eventually/core/Logging.hpp"

#include <QDate>
#include <QFile>
#include <QFileInfo>
#include <QTextStream>
#include <QTime>
#include <QTimeZone>
#include <algorithm>

namespace eventually {
namespace data {

namespace {
constexpr auto DATE_FORMAT = "yyyyMMdd";
constexpr auto DATE_TIME_FORMAT = "yyyyMMdd'T'hhmmss";
constexpr int MAX_RECURRENCE_STEPS = 50000;
const QTime END_OF_DAY(23, 59, 59);

enum class Frequency {
    None,
    Daily,
    Weekly,
    Monthly,
    Yearly
};

struct RecurrenceRule
{
    Frequency frequency = Frequency::None;
    int interval = 1;
    int count = 0;
    QDateTime until;
    QList<int> byDay;
};

int weekdayFromCode(const QString &code)
{
    static const QStringList codes = {QStringLiteral("MO"), QStringLiteral("TU"), QStringLiteral("WE"),
                                      QStringLiteral("TH"), QStringLiteral("FR"), QStringLiteral("SA"),
                                      QStringLiteral("SU")};
    // Ordinal prefixes such as "1MO" only matter for monthly rules.
    const int index = codes.indexOf(code.right(2).toUpper());
    return index < 0 ? 0 : index + 1;
}

RecurrenceRule parseRule(const QString &rrule)
{
    RecurrenceRule rule;
    const QStringList parts = rrule.split(';', Qt::SkipEmptyParts);
    for (const QString &part : parts) {
        const QString key = part.section('=', 0, 0).trimmed().toUpper();
        const QString value = part.section('=', 1).trimmed();
        if (key == QLatin1String("FREQ")) {
            const QString freq = value.toUpper();
            if (freq == QLatin1String("DAILY")) {
                rule.frequency = Frequency::Daily;
            } else if (freq == QLatin1String("WEEKLY")) {
                rule.frequency = Frequency::Weekly;
            } else if (freq == QLatin1String("MONTHLY")) {
                rule.frequency = Frequency::Monthly;
            } else if (freq == QLatin1String("YEARLY")) {
                rule.frequency = Frequency::Yearly;
            }
        } else if (key == QLatin1String("INTERVAL")) {
            rule.interval = qMax(1, value.toInt());
        } else if (key == QLatin1String("COUNT")) {
            rule.count = qMax(0, value.toInt());
        } else if (key == QLatin1String("UNTIL")) {
            if (value.size() == 8) {
                rule.until = QDateTime(QDate::fromString(value, DATE_FORMAT), END_OF_DAY);
            } else if (value.endsWith('Z')) {
                QDateTime until = QDateTime::fromString(value.left(value.size() - 1), DATE_TIME_FORMAT);
                until.setTimeSpec(Qt::UTC);
                rule.until = until.toLocalTime();
            } else {
                rule.until = QDateTime::fromString(value, DATE_TIME_FORMAT);
            }
        } else if (key == QLatin1String("BYDAY")) {
            for (const QString &day : value.split(',', Qt::SkipEmptyParts)) {
                const int weekday = weekdayFromCode(day.trimmed());
                if (weekday > 0 && !rule.byDay.contains(weekday)) {
                    rule.byDay << weekday;
                }
            }
            std::sort(rule.byDay.begin(), rule.byDay.end());
        }
    }
    return rule;
}

QDateTime withDate(const QDateTime &base, const QDate &date)
{
    QDateTime moved = base;
    moved.setDate(date);
    return moved;
}
} // namespace

IcsEventSource::IcsEventSource(QStringList filePaths)
    : m_filePaths(std::move(filePaths))
{
}

IcsEventSource::~IcsEventSource() = default;

void IcsEventSource::requestAccess(AccessCallback completion)
{
    bool granted = !m_filePaths.isEmpty();
    for (const QString &path : m_filePaths) {
        const QFileInfo info(path);
        if (!info.exists() || !info.isReadable()) {
            qCWarning(EVENTUALLY_DATA_LOG) << "IcsEventSource::requestAccess: cannot read" << path;
            granted = false;
        }
    }
    completion(granted);
}

std::optional<std::vector<CalendarRecord>> IcsEventSource::fetchRecords(const QDateTime &from,
                                                                        const QDateTime &to) const
{
    std::vector<CalendarRecord> records;
    for (const QString &path : m_filePaths) {
        std::vector<ParsedEvent> events;
        QColor calendarColor;
        if (!loadFile(path, events, calendarColor)) {
            return std::nullopt;
        }
        for (const ParsedEvent &event : events) {
            appendOccurrences(event, calendarColor, from, to, records);
        }
    }
    qCDebug(EVENTUALLY_DATA_LOG) << "IcsEventSource::fetchRecords:" << records.size() << "records between" << from
                                 << "and" << to;
    return records;
}

QStringList IcsEventSource::watchedPaths() const
{
    return m_filePaths;
}

bool IcsEventSource::loadFile(const QString &filePath, std::vector<ParsedEvent> &events, QColor &calendarColor) const
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qCWarning(EVENTUALLY_DATA_LOG) << "IcsEventSource::loadFile: cannot open" << filePath << file.errorString();
        return false;
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");

    bool inEvent = false;
    int nestedDepth = 0;
    ParsedEvent current;

    auto finalizeEvent = [&]() {
        if (!current.start.isValid()) {
            qCDebug(EVENTUALLY_DATA_LOG) << "IcsEventSource::loadFile: skipping event without DTSTART" << current.uid;
            current = ParsedEvent{};
            return;
        }
        if (current.allDay) {
            // All-day events span midnight to 23:59:59; DTEND is exclusive.
            const QDate firstDay = current.start.date();
            QDate lastDay = current.end.isValid() ? current.end.date().addDays(-1) : firstDay;
            if (lastDay < firstDay) {
                lastDay = firstDay;
            }
            current.start = QDateTime(firstDay, QTime(0, 0));
            current.end = QDateTime(lastDay, END_OF_DAY);
        } else if (!current.end.isValid() || current.end < current.start) {
            current.end = current.start.addSecs(30 * 60);
        }
        events.push_back(current);
        current = ParsedEvent{};
    };

    auto handleLine = [&](const QString &line) {
        if (line == QLatin1String("BEGIN:VEVENT")) {
            inEvent = true;
            nestedDepth = 0;
            current = ParsedEvent{};
            return;
        }
        if (line == QLatin1String("END:VEVENT")) {
            if (inEvent) {
                finalizeEvent();
            }
            inEvent = false;
            return;
        }
        // VALARM and friends carry their own SUMMARY/DESCRIPTION lines.
        if (inEvent && line.startsWith(QLatin1String("BEGIN:"))) {
            ++nestedDepth;
            return;
        }
        if (inEvent && line.startsWith(QLatin1String("END:"))) {
            nestedDepth = qMax(0, nestedDepth - 1);
            return;
        }

        const int colonIndex = line.indexOf(':');
        if (colonIndex <= 0) {
            return;
        }

        const QString property = line.left(colonIndex);
        const QString rawValue = line.mid(colonIndex + 1);
        const QString name = property.section(';', 0, 0).toUpper();
        const QString parameters = property.contains(';') ? property.section(';', 1) : QString();

        if (!inEvent) {
            if (name == QLatin1String("X-APPLE-CALENDAR-COLOR")) {
                calendarColor = parseColor(rawValue);
            }
            return;
        }
        if (nestedDepth > 0) {
            return;
        }

        const bool dateOnlyParam = parameters.contains(QLatin1String("VALUE=DATE"), Qt::CaseInsensitive)
            && !parameters.contains(QLatin1String("VALUE=DATE-TIME"), Qt::CaseInsensitive);

        if (name == QLatin1String("UID")) {
            current.uid = decodeText(rawValue);
        } else if (name == QLatin1String("SUMMARY")) {
            current.summary = decodeText(rawValue);
        } else if (name == QLatin1String("LOCATION")) {
            current.location = decodeText(rawValue);
        } else if (name == QLatin1String("DTSTART")) {
            current.start = parseDateTime(rawValue, parameters);
            current.allDay = dateOnlyParam || rawValue.size() == 8;
        } else if (name == QLatin1String("DTEND")) {
            current.end = parseDateTime(rawValue, parameters);
        } else if (name == QLatin1String("RRULE")) {
            current.recurrenceRule = rawValue;
        } else if (name == QLatin1String("EXDATE")) {
            for (const QString &value : rawValue.split(',', Qt::SkipEmptyParts)) {
                const QDateTime excluded = parseDateTime(value, parameters);
                if (excluded.isValid()) {
                    current.exceptionDates << excluded;
                }
            }
        } else if (name == QLatin1String("COLOR")) {
            current.color = parseColor(rawValue);
        }
    };

    QString accumulator;
    bool hasAccumulator = false;
    while (!stream.atEnd()) {
        QString line = stream.readLine();
        if (!line.isEmpty() && (line.startsWith(' ') || line.startsWith('\t'))) {
            if (hasAccumulator) {
                accumulator += line.mid(1);
            }
        } else {
            if (hasAccumulator) {
                handleLine(accumulator);
            }
            accumulator = line;
            hasAccumulator = true;
        }
    }
    if (hasAccumulator) {
        handleLine(accumulator);
    }
    return true;
}

void IcsEventSource::appendOccurrences(const ParsedEvent &event,
                                       const QColor &calendarColor,
                                       const QDateTime &from,
                                       const QDateTime &to,
                                       std::vector<CalendarRecord> &records)
{
    const bool recurring = !event.recurrenceRule.isEmpty();
    std::vector<QDateTime> starts;
    if (recurring) {
        starts = expandRecurrence(event.start, event.recurrenceRule, to);
    } else {
        starts.push_back(event.start);
    }

    const qint64 durationSecs = event.start.secsTo(event.end);
    const qint64 daySpan = event.start.date().daysTo(event.end.date());

    for (const QDateTime &start : starts) {
        const bool excluded = std::any_of(event.exceptionDates.cbegin(), event.exceptionDates.cend(),
                                          [&](const QDateTime &exdate) {
                                              return event.allDay ? exdate.date() == start.date() : exdate == start;
                                          });
        if (excluded) {
            continue;
        }

        const QDateTime end = event.allDay ? QDateTime(start.date().addDays(daySpan), END_OF_DAY)
                                           : start.addSecs(durationSecs);
        if (end < from || start > to) {
            continue;
        }

        CalendarRecord record;
        record.id = event.uid;
        record.title = event.summary;
        record.start = start;
        record.end = end;
        if (!event.location.isEmpty()) {
            record.location = event.location;
        }
        record.hasRecurrence = recurring;
        record.calendarColor = event.color.isValid() ? event.color : calendarColor;
        records.push_back(std::move(record));
    }
}

std::vector<QDateTime> IcsEventSource::expandRecurrence(const QDateTime &seriesStart,
                                                        const QString &rrule,
                                                        const QDateTime &to)
{
    std::vector<QDateTime> starts;
    const RecurrenceRule rule = parseRule(rrule);
    if (!seriesStart.isValid()) {
        return starts;
    }
    if (rule.frequency == Frequency::None) {
        qCDebug(EVENTUALLY_DATA_LOG) << "IcsEventSource::expandRecurrence: unsupported rule" << rrule;
        starts.push_back(seriesStart);
        return starts;
    }

    int produced = 0;
    // Returns false once the series is exhausted.
    auto accept = [&](const QDateTime &candidate) {
        if (candidate > to) {
            return false;
        }
        if (rule.until.isValid() && candidate > rule.until) {
            return false;
        }
        if (rule.count > 0 && produced >= rule.count) {
            return false;
        }
        ++produced;
        starts.push_back(candidate);
        return true;
    };

    const QDate firstDate = seriesStart.date();
    for (int step = 0; step < MAX_RECURRENCE_STEPS; ++step) {
        const int offset = step * rule.interval;
        switch (rule.frequency) {
        case Frequency::Daily:
            if (!accept(withDate(seriesStart, firstDate.addDays(offset)))) {
                return starts;
            }
            break;
        case Frequency::Weekly:
            if (rule.byDay.isEmpty()) {
                if (!accept(withDate(seriesStart, firstDate.addDays(7 * offset)))) {
                    return starts;
                }
            } else {
                const QDate weekStart = firstDate.addDays(1 - firstDate.dayOfWeek() + 7 * offset);
                for (int weekday : rule.byDay) {
                    const QDateTime candidate = withDate(seriesStart, weekStart.addDays(weekday - 1));
                    if (candidate < seriesStart) {
                        continue;
                    }
                    if (!accept(candidate)) {
                        return starts;
                    }
                }
            }
            break;
        case Frequency::Monthly: {
            const QDate date = firstDate.addMonths(offset);
            // addMonths clamps the 31st to shorter months; those months have no occurrence.
            if (date.day() != firstDate.day()) {
                if (withDate(seriesStart, date) > to) {
                    return starts;
                }
                break;
            }
            if (!accept(withDate(seriesStart, date))) {
                return starts;
            }
            break;
        }
        case Frequency::Yearly: {
            const QDate date = firstDate.addYears(offset);
            if (date.day() != firstDate.day()) {
                if (withDate(seriesStart, date) > to) {
                    return starts;
                }
                break;
            }
            if (!accept(withDate(seriesStart, date))) {
                return starts;
            }
            break;
        }
        case Frequency::None:
            return starts;
        }
    }
    qCWarning(EVENTUALLY_DATA_LOG) << "IcsEventSource::expandRecurrence: giving up after" << MAX_RECURRENCE_STEPS
                                   << "steps for" << rrule;
    return starts;
}

QString IcsEventSource::decodeText(const QString &text)
{
    QString decoded;
    decoded.reserve(text.size());
    for (int i = 0; i < text.size(); ++i) {
        const QChar ch = text.at(i);
        if (ch != QLatin1Char('\\') || i + 1 == text.size()) {
            decoded.append(ch);
            continue;
        }
        const QChar next = text.at(++i);
        if (next == QLatin1Char('n') || next == QLatin1Char('N')) {
            decoded.append(QLatin1Char('\n'));
        } else if (next == QLatin1Char(',') || next == QLatin1Char(';') || next == QLatin1Char('\\')) {
            decoded.append(next);
        } else {
            // Unknown escape, keep it verbatim.
            decoded.append(ch);
            decoded.append(next);
        }
    }
    return decoded;
}

QDateTime IcsEventSource::parseDateTime(const QString &value, const QString &parameters)
{
    if (value.length() == 8) {
        const QDate date = QDate::fromString(value, DATE_FORMAT);
        return QDateTime(date, QTime(0, 0));
    }
    if (value.endsWith('Z')) {
        QDateTime dt = QDateTime::fromString(value.left(value.length() - 1), DATE_TIME_FORMAT);
        dt.setTimeSpec(Qt::UTC);
        return dt.toLocalTime();
    }

    QDateTime dt = QDateTime::fromString(value, DATE_TIME_FORMAT);
    if (!dt.isValid()) {
        dt = QDateTime::fromString(value, Qt::ISODate);
    }

    const int tzIndex = parameters.indexOf(QLatin1String("TZID="), 0, Qt::CaseInsensitive);
    if (dt.isValid() && tzIndex >= 0) {
        QString tzid = parameters.mid(tzIndex + 5).section(';', 0, 0);
        tzid.remove('"');
        const QTimeZone zone(tzid.toUtf8());
        if (zone.isValid()) {
            return QDateTime(dt.date(), dt.time(), zone).toLocalTime();
        }
        qCDebug(EVENTUALLY_DATA_LOG) << "IcsEventSource::parseDateTime: unknown TZID" << tzid << "treated as local";
    }
    return dt;
}

QColor IcsEventSource::parseColor(const QString &value)
{
    QString name = value.trimmed();
    // Apple writes #RRGGBBAA; QColor would read that as #AARRGGBB.
    if (name.startsWith('#') && name.size() == 9) {
        name.truncate(7);
    }
    QColor color(name);
    return color;
}

} // namespace data
} // namespace eventually
