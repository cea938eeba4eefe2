#pragma once

#include <QDateTime>
#include <QObject>
#include <QString>
#include <vector>

#include "eventually/core/EventCollection.hpp"
#include "eventually/core/Formatting.hpp"
#include "eventually/ui/models/MenuModel.hpp"

namespace eventually {
namespace core {
class DismissedSet;
}
namespace data {
class EventSource;
}

namespace ui {

class StatusMenuViewModel : public QObject
{
    Q_OBJECT

public:
    StatusMenuViewModel(data::EventSource &source,
                        core::DismissedSet &dismissed,
                        core::TitleFormat format,
                        QObject *parent = nullptr);

    void refresh();
    void refreshAt(const QDateTime &now);

    // Records the dismissal, then refreshes.
    void dismiss(const QString &occurrenceKey);
    void dismissAt(const QString &occurrenceKey, const QDateTime &now);

    const core::EventCollection &collection() const;
    const QString &statusTitle() const;
    const std::vector<MenuRow> &rows() const;

signals:
    void changed();

private:
    data::EventSource &m_source;
    core::DismissedSet &m_dismissed;
    core::TitleFormat m_format;
    core::EventCollection m_collection;
    QString m_statusTitle;
    std::vector<MenuRow> m_rows;
};

} // namespace ui
} // namespace eventually
