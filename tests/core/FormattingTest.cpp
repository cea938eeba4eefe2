#include <QtTest/QtTest>

#include "eventually/core/Formatting.hpp"

using namespace eventually::core;

class FormattingTest : public QObject
{
    Q_OBJECT

private slots:
    void formatsClockTime();
    void detectsAllDayBoundaries();
    void formatsTimeLabels();
    void roundsToNearestHour();
    void truncatesByScalarValues();
    void truncationIsIdempotent();
    void truncationRespectsLimit_data();
    void truncationRespectsLimit();
    void formatsCurrentTitle();
    void formatsUpcomingTitle();
    void longTitleFitsBudget();
    void tinyBudgetDropsTitle();
};

void FormattingTest::formatsClockTime()
{
    QCOMPARE(formatTime(QDateTime(QDate(2024, 3, 12), QTime(9, 5))), QStringLiteral("09:05"));
    QCOMPARE(formatTime(QDateTime(QDate(2024, 3, 12), QTime(23, 59, 59))), QStringLiteral("23:59"));
}

void FormattingTest::detectsAllDayBoundaries()
{
    const QDate day(2024, 3, 12);
    QVERIFY(isAllDay(QDateTime(day, QTime(0, 0)), QDateTime(day, QTime(23, 59, 59))));
    QVERIFY(!isAllDay(QDateTime(day, QTime(0, 0)), QDateTime(day, QTime(23, 59, 58))));
    QVERIFY(!isAllDay(QDateTime(day, QTime(0, 0, 1)), QDateTime(day, QTime(23, 59, 59))));
    // Multi-day all-day events keep the convention on their last day.
    QVERIFY(isAllDay(QDateTime(day, QTime(0, 0)), QDateTime(day.addDays(2), QTime(23, 59, 59))));
}

void FormattingTest::formatsTimeLabels()
{
    QCOMPARE(formatTimeLabel(0), QStringLiteral("0m"));
    QCOMPARE(formatTimeLabel(45), QStringLiteral("45m"));
    QCOMPARE(formatTimeLabel(60), QStringLiteral("60m"));
    QCOMPARE(formatTimeLabel(61), QStringLiteral("1h"));
    QCOMPARE(formatTimeLabel(119), QStringLiteral("1h"));
    QCOMPARE(formatTimeLabel(150), QStringLiteral("2h"));
}

void FormattingTest::roundsToNearestHour()
{
    QCOMPARE(formatTimeLabel(89, HourRounding::Nearest), QStringLiteral("1h"));
    QCOMPARE(formatTimeLabel(90, HourRounding::Nearest), QStringLiteral("2h"));
    QCOMPARE(formatTimeLabel(150, HourRounding::Nearest), QStringLiteral("3h"));
    QCOMPARE(formatTimeLabel(59, HourRounding::Nearest), QStringLiteral("59m"));
}

void FormattingTest::truncatesByScalarValues()
{
    const QString title = QStringLiteral("Café \U0001F600 planning");
    QCOMPARE(characterCount(title), 15);

    const QString truncated = truncateTitle(title, 7);
    QCOMPARE(characterCount(truncated), 7);
    QCOMPARE(truncated, QStringLiteral("Café \U0001F600…"));
}

void FormattingTest::truncationIsIdempotent()
{
    const QString once = truncateTitle(QStringLiteral("Quarterly business review"), 10);
    QCOMPARE(truncateTitle(once, 10), once);
    QCOMPARE(truncateTitle(QStringLiteral("Short"), 10), QStringLiteral("Short"));
}

void FormattingTest::truncationRespectsLimit_data()
{
    QTest::addColumn<QString>("title");
    QTest::addColumn<int>("limit");

    QTest::newRow("empty") << QString() << 5;
    QTest::newRow("exact") << QStringLiteral("Exact") << 5;
    QTest::newRow("one over") << QStringLiteral("Exact!") << 5;
    QTest::newRow("limit one") << QStringLiteral("Standup") << 1;
    QTest::newRow("limit zero") << QStringLiteral("Standup") << 0;
    QTest::newRow("emoji") << QStringLiteral("\U0001F680\U0001F680\U0001F680\U0001F680") << 3;
}

void FormattingTest::truncationRespectsLimit()
{
    QFETCH(QString, title);
    QFETCH(int, limit);
    QVERIFY(characterCount(truncateTitle(title, limit)) <= limit);
}

void FormattingTest::formatsCurrentTitle()
{
    QCOMPARE(formatStatusTitle(QStringLiteral("Standup"), 20 * 60, StatusTemplate::TimeLeft, TitleFormat{}),
             QStringLiteral("Standup • 20m left"));
}

void FormattingTest::formatsUpcomingTitle()
{
    QCOMPARE(formatStatusTitle(QStringLiteral("Lunch"), 2 * 3600 + 59, StatusTemplate::StartsIn, TitleFormat{}),
             QStringLiteral("Lunch • in 2h"));
    TitleFormat nearest;
    nearest.rounding = HourRounding::Nearest;
    QCOMPARE(formatStatusTitle(QStringLiteral("Lunch"), 150 * 60, StatusTemplate::StartsIn, nearest),
             QStringLiteral("Lunch • in 3h"));
}

void FormattingTest::longTitleFitsBudget()
{
    const QString title = QStringLiteral("Architecture review with the platform team");
    const QString current = formatStatusTitle(title, 45 * 60, StatusTemplate::TimeLeft, TitleFormat{});
    QCOMPARE(characterCount(current), 30);
    QVERIFY(current.endsWith(QStringLiteral("… • 45m left")));

    TitleFormat loose;
    loose.maxLength = 50;
    const QString upcoming = formatStatusTitle(title, 3 * 60, StatusTemplate::StartsIn, loose);
    QCOMPARE(upcoming, title + QStringLiteral(" • in 3m"));
}

void FormattingTest::tinyBudgetDropsTitle()
{
    TitleFormat tiny;
    tiny.maxLength = 5;
    QCOMPARE(formatStatusTitle(QStringLiteral("Standup"), 5 * 60, StatusTemplate::TimeLeft, tiny),
             QStringLiteral(" • 5m left"));
}

QTEST_GUILESS_MAIN(FormattingTest)
#include "FormattingTest.moc"
