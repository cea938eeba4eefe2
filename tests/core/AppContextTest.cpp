#include <QtTest/QtTest>

#include "eventually/core/AppContext.hpp"
#include "eventually/core/DismissedSet.hpp"
#include "eventually/data/InMemoryEventSource.hpp"

using namespace eventually;

class AppContextTest : public QObject
{
    Q_OBJECT

private slots:
    void ownsInjectedSource();
    void readsCalendarFilesFromSettings();
};

void AppContextTest::ownsInjectedSource()
{
    auto source = std::make_unique<data::InMemoryEventSource>();
    data::InMemoryEventSource *raw = source.get();

    core::Settings settings;
    settings.refreshIntervalSeconds = 90;
    core::AppContext context(settings, std::move(source));

    QCOMPARE(&context.eventSource(), static_cast<data::EventSource *>(raw));
    QCOMPARE(context.settings().refreshIntervalSeconds, 90);
    QVERIFY(context.dismissedSet().dismiss(QStringLiteral("a|||1")));
    QVERIFY(context.dismissedSet().contains(QStringLiteral("a|||1")));
}

void AppContextTest::readsCalendarFilesFromSettings()
{
    core::Settings settings;
    settings.calendarFiles = {QStringLiteral("/nonexistent/work.ics")};
    core::AppContext context(settings);

    QCOMPARE(context.eventSource().watchedPaths(), settings.calendarFiles);
    QVERIFY(!context.eventSource().fetchRecords(QDateTime(QDate(2024, 3, 12), QTime(0, 0)),
                                                QDateTime(QDate(2024, 3, 12), QTime(23, 59, 59))));
}

QTEST_GUILESS_MAIN(AppContextTest)
#include "AppContextTest.moc"
