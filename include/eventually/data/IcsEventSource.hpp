#pragma once

#include <QColor>
#include <QDateTime>
#include <QList>
#include <QString>
#include <QStringList>

#include "eventually/data/EventSource.hpp"

namespace eventually {
namespace data {

// Reads iCalendar files, one calendar per file. Files are re-read on every
// fetch so external edits show up on the next refresh.
class IcsEventSource : public EventSource
{
public:
    explicit IcsEventSource(QStringList filePaths);
    ~IcsEventSource() override;

    void requestAccess(AccessCallback completion) override;
    std::optional<std::vector<CalendarRecord>> fetchRecords(const QDateTime &from,
                                                            const QDateTime &to) const override;
    QStringList watchedPaths() const override;

    // Start times of a series up to `to`, honouring COUNT, UNTIL, INTERVAL and
    // weekly BYDAY. Unsupported rules yield the series start only.
    static std::vector<QDateTime> expandRecurrence(const QDateTime &seriesStart,
                                                   const QString &rrule,
                                                   const QDateTime &to);

private:
    struct ParsedEvent
    {
        QString uid;
        QString summary;
        QString location;
        QDateTime start;
        QDateTime end;
        bool allDay = false;
        QString recurrenceRule;
        QList<QDateTime> exceptionDates;
        QColor color;
    };

    bool loadFile(const QString &filePath, std::vector<ParsedEvent> &events, QColor &calendarColor) const;
    static void appendOccurrences(const ParsedEvent &event,
                                  const QColor &calendarColor,
                                  const QDateTime &from,
                                  const QDateTime &to,
                                  std::vector<CalendarRecord> &records);

    static QString decodeText(const QString &text);
    static QDateTime parseDateTime(const QString &value, const QString &parameters);
    static QColor parseColor(const QString &value);

    QStringList m_filePaths;
};

} // namespace data
} // namespace eventually
