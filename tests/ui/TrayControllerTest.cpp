#include <QtTest/QtTest>

#include "eventually/core/AppContext.hpp"
#include "eventually/core/DismissedSet.hpp"
#include "eventually/data/IcsEventSource.hpp"
#include "eventually/data/InMemoryEventSource.hpp"
#include "eventually/ui/TrayController.hpp"

#include <QTemporaryDir>
#include <memory>

using namespace eventually;

namespace {
core::Settings testSettings()
{
    core::Settings settings;
    settings.showTitleInTray = false;
    return settings;
}

data::CalendarRecord lateRecord()
{
    data::CalendarRecord record;
    record.id = QStringLiteral("late");
    record.title = QStringLiteral("Late review");
    record.start = QDateTime(QDate::currentDate(), QTime(23, 58));
    record.end = QDateTime(QDate::currentDate(), QTime(23, 59));
    return record;
}
} // namespace

class TrayControllerTest : public QObject
{
    Q_OBJECT

private slots:
    void dismissUpdatesSetAndMenu();
    void ignoresActionsWithoutTarget();
    void rewatchesCalendarFilesAfterWake();
    void regularTickKeepsWatcher();
};

void TrayControllerTest::dismissUpdatesSetAndMenu()
{
    auto source = std::make_unique<data::InMemoryEventSource>();
    const data::CalendarRecord record = lateRecord();
    source->addRecord(record);
    core::AppContext context(testSettings(), std::move(source));
    ui::TrayController controller(context);
    QSignalSpy spy(&controller.m_viewModel, &ui::StatusMenuViewModel::changed);

    const QString key = data::makeOccurrenceKey(record.id, record.start);
    controller.handleAction({ui::MenuActionKind::DismissEvent, key});

    QVERIFY(context.dismissedSet().contains(key));
    QCOMPARE(spy.count(), 1);
    QVERIFY(!controller.m_viewModel.rows().empty());
    QCOMPARE(controller.m_menu.actions().size(), static_cast<int>(controller.m_viewModel.rows().size()));
}

void TrayControllerTest::ignoresActionsWithoutTarget()
{
    core::AppContext context(testSettings(), std::make_unique<data::InMemoryEventSource>());
    ui::TrayController controller(context);
    QSignalSpy spy(&controller.m_viewModel, &ui::StatusMenuViewModel::changed);

    controller.handleAction({ui::MenuActionKind::None, QStringLiteral("late|||1")});
    controller.handleAction({ui::MenuActionKind::JoinCall, QString()});
    controller.handleAction({ui::MenuActionKind::DismissEvent, QString()});

    QCOMPARE(spy.count(), 0);
    QVERIFY(context.dismissedSet().snapshot().isEmpty());
    QVERIFY(!context.dismissedSet().contains(QStringLiteral("late|||1")));
}

void TrayControllerTest::rewatchesCalendarFilesAfterWake()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("work.ics"));
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Text));
    file.write("BEGIN:VCALENDAR\nVERSION:2.0\nEND:VCALENDAR\n");
    file.close();

    core::AppContext context(testSettings(), std::make_unique<data::IcsEventSource>(QStringList{path}));
    ui::TrayController controller(context);
    QVERIFY(controller.m_watcher.files().contains(path));

    // A file replaced while asleep is no longer watched.
    controller.m_watcher.removePath(path);
    QVERIFY(!controller.m_watcher.files().contains(path));

    const QDateTime now = QDateTime::currentDateTime();
    controller.m_lastTick = now.addSecs(-3600);
    QVERIFY(controller.tick(now));
    QVERIFY(controller.m_watcher.files().contains(path));
    QCOMPARE(controller.m_watcher.files().count(path), 1);
    QCOMPARE(controller.m_lastTick, now);
}

void TrayControllerTest::regularTickKeepsWatcher()
{
    core::AppContext context(testSettings(), std::make_unique<data::InMemoryEventSource>());
    ui::TrayController controller(context);

    const QDateTime now = QDateTime::currentDateTime();
    QVERIFY(!controller.tick(now));
    QVERIFY(!controller.tick(now.addSecs(context.settings().refreshIntervalSeconds)));
    QCOMPARE(controller.m_lastTick, now.addSecs(context.settings().refreshIntervalSeconds));
}

QTEST_MAIN(TrayControllerTest)
#include "TrayControllerTest.moc"
