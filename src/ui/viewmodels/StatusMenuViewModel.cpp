#include "eventually/ui/viewmodels/StatusMenuViewModel.hpp"

#include "eventually/core/DismissedSet.hpp"
#include "eventually/core/Errors.hpp"
#include "eventually/core/Logging.hpp"
#include "eventually/data/EventSource.hpp"

namespace eventually {
namespace ui {

StatusMenuViewModel::StatusMenuViewModel(data::EventSource &source,
                                         core::DismissedSet &dismissed,
                                         core::TitleFormat format,
                                         QObject *parent)
    : QObject(parent)
    , m_source(source)
    , m_dismissed(dismissed)
    , m_format(format)
{
}

void StatusMenuViewModel::refresh()
{
    refreshAt(QDateTime::currentDateTime());
}

void StatusMenuViewModel::refreshAt(const QDateTime &now)
{
    const auto window = core::EventCollection::fetchWindow(now);
    const auto records = m_source.fetchRecords(window.first, window.second);
    if (records) {
        m_collection = core::EventCollection::fromRecords(*records);
    } else {
        qCWarning(EVENTUALLY_UI_LOG) << "StatusMenuViewModel::refresh:"
                                     << core::errorMessage(core::CalendarError::StoreUnavailable);
        m_collection = core::EventCollection();
    }

    const QSet<QString> dismissed = m_dismissed.snapshot();
    m_statusTitle = m_collection.statusTitle(dismissed, now, m_format);
    m_rows = buildMenuRows(m_collection, dismissed, now);

    qCDebug(EVENTUALLY_UI_LOG) << "StatusMenuViewModel::refresh:" << m_collection.size() << "events," << m_statusTitle;
    emit changed();
}

void StatusMenuViewModel::dismiss(const QString &occurrenceKey)
{
    dismissAt(occurrenceKey, QDateTime::currentDateTime());
}

void StatusMenuViewModel::dismissAt(const QString &occurrenceKey, const QDateTime &now)
{
    if (occurrenceKey.isEmpty()) {
        return;
    }
    if (!m_dismissed.dismiss(occurrenceKey)) {
        qCWarning(EVENTUALLY_UI_LOG) << "StatusMenuViewModel::dismiss: dismissal of" << occurrenceKey << "was dropped";
    }
    refreshAt(now);
}

const core::EventCollection &StatusMenuViewModel::collection() const
{
    return m_collection;
}

const QString &StatusMenuViewModel::statusTitle() const
{
    return m_statusTitle;
}

const std::vector<MenuRow> &StatusMenuViewModel::rows() const
{
    return m_rows;
}

} // namespace ui
} // namespace eventually
