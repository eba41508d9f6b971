#include <QtTest/QtTest>

#include <memory>

#include "agenda/core/RecurrenceEngine.hpp"
#include "agenda/core/TimezoneDatabase.hpp"
#include "agenda/core/TimezoneResolver.hpp"
#include "agenda/data/RRuleCodec.hpp"

using namespace agenda::core;
using namespace agenda::data;

namespace {
QDateTime utc(int year, int month, int day, int hour = 0, int minute = 0)
{
    return QDateTime(QDate(year, month, day), QTime(hour, minute), Qt::UTC);
}

EventTemplate makeEvent(const QDate &date, const QTime &start, const QTime &end, const QString &zone,
                        const QString &rrule = QString())
{
    EventTemplate event;
    event.id = QStringLiteral("standup");
    event.startLocal = LocalDateTime{ date, start };
    event.endLocal = LocalDateTime{ date, end };
    event.timezone = zone;
    if (!rrule.isEmpty()) {
        auto rule = RRuleCodec::parse(rrule);
        if (rule.ok()) {
            event.recurrence = rule.value();
        }
    }
    return event;
}

QList<QDate> localDates(const std::vector<Occurrence> &occurrences, const QString &zone)
{
    const QTimeZone tz(zone.toUtf8());
    QList<QDate> dates;
    for (const Occurrence &occurrence : occurrences) {
        dates << TimezoneResolver::localIn(occurrence.interval.start, tz).date;
    }
    return dates;
}
} // namespace

class RecurrenceEngineTest : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();

    void validateReportsRuleErrors_data();
    void validateReportsRuleErrors();
    void validateAcceptsYearScopeOrdinals();
    void weeklyMondayScenario();
    void dailyKeepsWallClockAcrossDst();
    void gapStartShiftsForward();
    void monthDayBeyondMonthLengthSkipsMonth();
    void negativeMonthDayCountsFromMonthEnd();
    void missingNthWeekdaySkipsMonth();
    void exceptionsAreNotCounted();
    void countIsCumulativeAcrossWindows();
    void biweeklyKeepsAnchorWeekday();
    void yearlyByMonthDayCoversEveryMonth();
    void yearlyLeapDaySkipsCommonYears();
    void yearlyByDayOrdinalsCountWeeksOfYear();
    void overlapStartResolvesToEarlierInstant();
    void untilDateIsInclusive();
    void untilUtcComparesInstants();
    void overrideMovesSingleInstance();
    void movedInstanceKeepsDistinctId();
    void nonRecurringExpandsToSingleInterval();
    void unboundedExpansionIsRejected();
    void invalidTemplatesAreRejected();
    void cursorReplaysIdenticalSequence();
    void nextOccurrenceIsStrictlyAfter();

private:
    std::shared_ptr<const TimezoneDatabase> m_database;
    std::unique_ptr<TimezoneResolver> m_resolver;
    std::unique_ptr<RecurrenceEngine> m_engine;
};

void RecurrenceEngineTest::initTestCase()
{
    m_database = std::make_shared<TimezoneDatabase>(QSet<QByteArray>{ "America/New_York", "UTC" },
                                                    QStringLiteral("test"));
    m_resolver = std::make_unique<TimezoneResolver>(m_database);
    m_engine = std::make_unique<RecurrenceEngine>(*m_resolver, 1000);
}

void RecurrenceEngineTest::validateReportsRuleErrors_data()
{
    QTest::addColumn<QString>("rrule");
    QTest::addColumn<int>("expected");

    QTest::newRow("until and count") << QStringLiteral("FREQ=DAILY;COUNT=2;UNTIL=20260101")
                                     << int(RuleError::ConflictingTerminators);
    QTest::newRow("zero interval") << QStringLiteral("FREQ=DAILY;INTERVAL=0") << int(RuleError::InvalidInterval);
    QTest::newRow("empty byday") << QStringLiteral("FREQ=WEEKLY;BYDAY=") << int(RuleError::EmptyByWeekday);
    QTest::newRow("month day 32") << QStringLiteral("FREQ=MONTHLY;BYMONTHDAY=32") << int(RuleError::InvalidMonthDay);
    QTest::newRow("month day 0") << QStringLiteral("FREQ=MONTHLY;BYMONTHDAY=0") << int(RuleError::InvalidMonthDay);
    QTest::newRow("month day -32") << QStringLiteral("FREQ=MONTHLY;BYMONTHDAY=-32") << int(RuleError::InvalidMonthDay);
    QTest::newRow("zero count") << QStringLiteral("FREQ=DAILY;COUNT=0") << int(RuleError::InvalidCount);
    QTest::newRow("weekly ordinal") << QStringLiteral("FREQ=WEEKLY;BYDAY=2MO") << int(RuleError::InvalidOrdinal);
    QTest::newRow("sixth monday") << QStringLiteral("FREQ=MONTHLY;BYDAY=6MO") << int(RuleError::InvalidOrdinal);
    QTest::newRow("month 13") << QStringLiteral("FREQ=YEARLY;BYMONTH=13") << int(RuleError::InvalidMonth);
}

void RecurrenceEngineTest::validateReportsRuleErrors()
{
    QFETCH(QString, rrule);
    QFETCH(int, expected);

    const auto parsed = RRuleCodec::parse(rrule);
    QVERIFY(parsed.ok());
    const auto error = RecurrenceEngine::validate(parsed.value());
    QVERIFY(error.has_value());
    QCOMPARE(int(*error), expected);

    // The same rule inside a template fails expansion with the rule error.
    EventTemplate event = makeEvent(QDate(2026, 1, 5), QTime(9, 0), QTime(10, 0), QStringLiteral("UTC"));
    event.recurrence = parsed.value();
    const auto expanded = m_engine->expand(event, utc(2026, 1, 1), utc(2026, 2, 1));
    QVERIFY(!expanded.ok());
    QCOMPARE(expanded.error().code, ErrorCode::Rule);
    QCOMPARE(int(expanded.error().rule), expected);
}

void RecurrenceEngineTest::validateAcceptsYearScopeOrdinals()
{
    const auto twentieth = RRuleCodec::parse(QStringLiteral("FREQ=YEARLY;BYDAY=20MO"));
    QVERIFY(twentieth.ok());
    QVERIFY(!RecurrenceEngine::validate(twentieth.value()).has_value());

    const auto inMonth = RRuleCodec::parse(QStringLiteral("FREQ=YEARLY;BYMONTH=3;BYDAY=20MO"));
    QVERIFY(inMonth.ok());
    QCOMPARE(*RecurrenceEngine::validate(inMonth.value()), RuleError::InvalidOrdinal);
}

void RecurrenceEngineTest::weeklyMondayScenario()
{
    const QString zone = QStringLiteral("America/New_York");
    const EventTemplate event = makeEvent(QDate(2026, 2, 2), QTime(9, 0), QTime(9, 30), zone,
                                          QStringLiteral("FREQ=WEEKLY;BYDAY=MO;COUNT=3"));

    const auto result = m_engine->expand(event, utc(2026, 2, 1, 5), utc(2026, 3, 1, 5));
    QVERIFY(result.ok());
    const auto &occurrences = result.value();
    QCOMPARE(int(occurrences.size()), 3);
    QCOMPARE(localDates(occurrences, zone),
             (QList<QDate>{ QDate(2026, 2, 2), QDate(2026, 2, 9), QDate(2026, 2, 16) }));
    for (const Occurrence &occurrence : occurrences) {
        QCOMPARE(occurrence.sourceEventId, QStringLiteral("standup"));
        QCOMPARE(occurrence.interval.durationSecs(), qint64(30 * 60));
        QCOMPARE(occurrence.interval.start.time(), QTime(14, 0));
        QVERIFY(!occurrence.isException);
    }
    QCOMPARE(occurrences.front().id(), QStringLiteral("standup@20260202T140000Z"));
}

void RecurrenceEngineTest::dailyKeepsWallClockAcrossDst()
{
    const QString zone = QStringLiteral("America/New_York");
    const EventTemplate event = makeEvent(QDate(2026, 3, 6), QTime(9, 0), QTime(10, 0), zone,
                                          QStringLiteral("FREQ=DAILY;COUNT=4"));

    const auto result = m_engine->expand(event, utc(2026, 3, 1), utc(2026, 3, 31));
    QVERIFY(result.ok());
    const auto &occurrences = result.value();
    QCOMPARE(int(occurrences.size()), 4);

    for (const Occurrence &occurrence : occurrences) {
        const auto local = m_resolver->toLocal(occurrence.interval.start, zone);
        QVERIFY(local.ok());
        QCOMPARE(local.value().time, QTime(9, 0));
    }
    QCOMPARE(occurrences[1].interval.start, utc(2026, 3, 7, 14));
    QCOMPARE(occurrences[2].interval.start, utc(2026, 3, 8, 13));
    // The transition day is one hour shorter on the UTC axis.
    QCOMPARE(occurrences[1].interval.start.secsTo(occurrences[2].interval.start), qint64(23 * 60 * 60));
    QCOMPARE(occurrences[2].interval.start.secsTo(occurrences[3].interval.start), qint64(24 * 60 * 60));
}

void RecurrenceEngineTest::gapStartShiftsForward()
{
    const EventTemplate event = makeEvent(QDate(2026, 3, 7), QTime(2, 30), QTime(3, 0),
                                          QStringLiteral("America/New_York"), QStringLiteral("FREQ=DAILY;COUNT=3"));

    const auto result = m_engine->expand(event, utc(2026, 3, 1), utc(2026, 3, 31));
    QVERIFY(result.ok());
    const auto &occurrences = result.value();
    QCOMPARE(int(occurrences.size()), 3);
    QCOMPARE(occurrences[0].interval.start, utc(2026, 3, 7, 7, 30));
    QCOMPARE(occurrences[1].interval.start, utc(2026, 3, 8, 7, 30));
    QCOMPARE(occurrences[2].interval.start, utc(2026, 3, 9, 6, 30));
    QCOMPARE(occurrences[1].interval.durationSecs(), qint64(30 * 60));
}

void RecurrenceEngineTest::monthDayBeyondMonthLengthSkipsMonth()
{
    const QString zone = QStringLiteral("UTC");
    const EventTemplate event = makeEvent(QDate(2026, 1, 31), QTime(10, 0), QTime(11, 0), zone,
                                          QStringLiteral("FREQ=MONTHLY;COUNT=4"));

    const auto result = m_engine->expand(event, utc(2026, 1, 1), QDateTime());
    QVERIFY(result.ok());
    QCOMPARE(localDates(result.value(), zone),
             (QList<QDate>{ QDate(2026, 1, 31), QDate(2026, 3, 31), QDate(2026, 5, 31), QDate(2026, 7, 31) }));
}

void RecurrenceEngineTest::negativeMonthDayCountsFromMonthEnd()
{
    const QString zone = QStringLiteral("UTC");
    const EventTemplate event = makeEvent(QDate(2026, 1, 31), QTime(10, 0), QTime(11, 0), zone,
                                          QStringLiteral("FREQ=MONTHLY;BYMONTHDAY=-1;COUNT=3"));

    const auto result = m_engine->expand(event, utc(2026, 1, 1), QDateTime());
    QVERIFY(result.ok());
    QCOMPARE(localDates(result.value(), zone),
             (QList<QDate>{ QDate(2026, 1, 31), QDate(2026, 2, 28), QDate(2026, 3, 31) }));
}

void RecurrenceEngineTest::missingNthWeekdaySkipsMonth()
{
    const QString zone = QStringLiteral("UTC");
    const EventTemplate event = makeEvent(QDate(2026, 1, 1), QTime(10, 0), QTime(11, 0), zone,
                                          QStringLiteral("FREQ=MONTHLY;BYDAY=5MO;COUNT=2"));

    const auto result = m_engine->expand(event, utc(2026, 1, 1), QDateTime());
    QVERIFY(result.ok());
    QCOMPARE(localDates(result.value(), zone), (QList<QDate>{ QDate(2026, 3, 30), QDate(2026, 6, 29) }));
}

void RecurrenceEngineTest::exceptionsAreNotCounted()
{
    const QString zone = QStringLiteral("UTC");
    EventTemplate event = makeEvent(QDate(2026, 4, 1), QTime(10, 0), QTime(11, 0), zone,
                                    QStringLiteral("FREQ=DAILY;COUNT=3"));
    event.recurrence->exceptions.insert(QDate(2026, 4, 2));

    const auto result = m_engine->expand(event, utc(2026, 4, 1), utc(2026, 5, 1));
    QVERIFY(result.ok());
    QCOMPARE(localDates(result.value(), zone),
             (QList<QDate>{ QDate(2026, 4, 1), QDate(2026, 4, 3), QDate(2026, 4, 4) }));
}

void RecurrenceEngineTest::countIsCumulativeAcrossWindows()
{
    const EventTemplate event = makeEvent(QDate(2026, 4, 1), QTime(10, 0), QTime(11, 0), QStringLiteral("UTC"),
                                          QStringLiteral("FREQ=DAILY;COUNT=5"));

    const auto first = m_engine->occurrencesBetween(event, utc(2026, 4, 1), utc(2026, 4, 3));
    const auto second = m_engine->occurrencesBetween(event, utc(2026, 4, 3), utc(2026, 4, 10));
    const auto later = m_engine->occurrencesBetween(event, utc(2026, 4, 6), utc(2026, 4, 30));
    QVERIFY(first.ok());
    QVERIFY(second.ok());
    QVERIFY(later.ok());
    QCOMPARE(int(first.value().size()), 2);
    QCOMPARE(int(second.value().size()), 3);
    QCOMPARE(int(later.value().size()), 0);

    // A window cutting through an occurrence: expand sees it, the start-based
    // partition gives it to the earlier window only.
    const auto overlapping = m_engine->expand(event, utc(2026, 4, 2, 10, 30), utc(2026, 4, 3));
    const auto starting = m_engine->occurrencesBetween(event, utc(2026, 4, 2, 10, 30), utc(2026, 4, 3));
    QCOMPARE(int(overlapping.value().size()), 1);
    QCOMPARE(int(starting.value().size()), 0);
}

void RecurrenceEngineTest::biweeklyKeepsAnchorWeekday()
{
    const QString zone = QStringLiteral("UTC");
    const EventTemplate event = makeEvent(QDate(2026, 2, 4), QTime(10, 0), QTime(11, 0), zone,
                                          QStringLiteral("FREQ=WEEKLY;INTERVAL=2;COUNT=3"));

    const auto result = m_engine->expand(event, utc(2026, 2, 1), utc(2026, 4, 1));
    QVERIFY(result.ok());
    QCOMPARE(localDates(result.value(), zone),
             (QList<QDate>{ QDate(2026, 2, 4), QDate(2026, 2, 18), QDate(2026, 3, 4) }));
}

void RecurrenceEngineTest::yearlyByMonthDayCoversEveryMonth()
{
    const QString zone = QStringLiteral("UTC");
    const EventTemplate event = makeEvent(QDate(2026, 1, 15), QTime(8, 0), QTime(9, 0), zone,
                                          QStringLiteral("FREQ=YEARLY;BYMONTHDAY=15;COUNT=3"));

    const auto result = m_engine->expand(event, utc(2026, 1, 1), QDateTime());
    QVERIFY(result.ok());
    QCOMPARE(localDates(result.value(), zone),
             (QList<QDate>{ QDate(2026, 1, 15), QDate(2026, 2, 15), QDate(2026, 3, 15) }));
}

void RecurrenceEngineTest::yearlyLeapDaySkipsCommonYears()
{
    const QString zone = QStringLiteral("UTC");
    const EventTemplate event = makeEvent(QDate(2028, 2, 29), QTime(12, 0), QTime(13, 0), zone,
                                          QStringLiteral("FREQ=YEARLY;COUNT=3"));

    const auto result = m_engine->expand(event, utc(2028, 1, 1), QDateTime());
    QVERIFY(result.ok());
    QCOMPARE(localDates(result.value(), zone),
             (QList<QDate>{ QDate(2028, 2, 29), QDate(2032, 2, 29), QDate(2036, 2, 29) }));
}

void RecurrenceEngineTest::yearlyByDayOrdinalsCountWeeksOfYear()
{
    const QString zone = QStringLiteral("UTC");
    const EventTemplate event = makeEvent(QDate(2026, 1, 5), QTime(10, 0), QTime(11, 0), zone,
                                          QStringLiteral("FREQ=YEARLY;BYDAY=20MO,-1MO;COUNT=4"));

    const auto result = m_engine->expand(event, utc(2026, 1, 1), QDateTime());
    QVERIFY(result.ok());
    QCOMPARE(localDates(result.value(), zone), (QList<QDate>{ QDate(2026, 5, 18), QDate(2026, 12, 28),
                                                              QDate(2027, 5, 17), QDate(2027, 12, 27) }));
}

void RecurrenceEngineTest::overlapStartResolvesToEarlierInstant()
{
    // 01:30 happens twice in New York on 2026-11-01.
    const EventTemplate event = makeEvent(QDate(2026, 10, 31), QTime(1, 30), QTime(2, 0),
                                          QStringLiteral("America/New_York"), QStringLiteral("FREQ=DAILY;COUNT=3"));

    const auto result = m_engine->expand(event, utc(2026, 10, 1), utc(2026, 12, 1));
    QVERIFY(result.ok());
    const auto &occurrences = result.value();
    QCOMPARE(int(occurrences.size()), 3);
    QCOMPARE(occurrences[0].interval.start, utc(2026, 10, 31, 5, 30));
    QCOMPARE(occurrences[1].interval.start, utc(2026, 11, 1, 5, 30));
    QCOMPARE(occurrences[2].interval.start, utc(2026, 11, 2, 6, 30));
    for (const Occurrence &occurrence : occurrences) {
        QCOMPARE(occurrence.interval.durationSecs(), qint64(30 * 60));
    }
}

void RecurrenceEngineTest::untilDateIsInclusive()
{
    const QString zone = QStringLiteral("UTC");
    const EventTemplate event = makeEvent(QDate(2026, 4, 1), QTime(10, 0), QTime(11, 0), zone,
                                          QStringLiteral("FREQ=DAILY;UNTIL=20260403"));

    const auto result = m_engine->expand(event, utc(2026, 3, 1), QDateTime());
    QVERIFY(result.ok());
    QCOMPARE(localDates(result.value(), zone),
             (QList<QDate>{ QDate(2026, 4, 1), QDate(2026, 4, 2), QDate(2026, 4, 3) }));
}

void RecurrenceEngineTest::untilUtcComparesInstants()
{
    const EventTemplate event = makeEvent(QDate(2026, 4, 1), QTime(9, 0), QTime(9, 15),
                                          QStringLiteral("America/New_York"),
                                          QStringLiteral("FREQ=DAILY;UNTIL=20260402T130000Z"));

    const auto result = m_engine->expand(event, utc(2026, 3, 1), QDateTime());
    QVERIFY(result.ok());
    QCOMPARE(int(result.value().size()), 2);
    QCOMPARE(result.value().back().interval.start, utc(2026, 4, 2, 13));
}

void RecurrenceEngineTest::overrideMovesSingleInstance()
{
    const QString zone = QStringLiteral("America/New_York");
    EventTemplate event = makeEvent(QDate(2026, 2, 2), QTime(9, 0), QTime(9, 30), zone,
                                    QStringLiteral("FREQ=WEEKLY;BYDAY=MO;COUNT=3"));
    event.overrides.push_back(OccurrenceOverride{ QDate(2026, 2, 9), LocalDateTime{ QDate(2026, 2, 10), QTime(11, 0) },
                                                  LocalDateTime{ QDate(2026, 2, 10), QTime(12, 0) } });

    const auto result = m_engine->expand(event, utc(2026, 2, 1), utc(2026, 3, 1));
    QVERIFY(result.ok());
    const auto &occurrences = result.value();
    QCOMPARE(int(occurrences.size()), 3);
    QVERIFY(!occurrences[0].isException);
    QVERIFY(occurrences[1].isException);
    QCOMPARE(occurrences[1].recurrenceDate, QDate(2026, 2, 9));
    QCOMPARE(occurrences[1].interval.start, utc(2026, 2, 10, 16));
    QCOMPARE(occurrences[1].interval.end, utc(2026, 2, 10, 17));
    QCOMPARE(occurrences[2].interval.start, utc(2026, 2, 16, 14));
}

void RecurrenceEngineTest::movedInstanceKeepsDistinctId()
{
    const QString zone = QStringLiteral("America/New_York");
    EventTemplate event = makeEvent(QDate(2026, 2, 2), QTime(9, 0), QTime(9, 30), zone,
                                    QStringLiteral("FREQ=WEEKLY;BYDAY=MO;COUNT=3"));
    event.overrides.push_back(OccurrenceOverride{ QDate(2026, 2, 9), LocalDateTime{ QDate(2026, 2, 16), QTime(9, 0) },
                                                  LocalDateTime{ QDate(2026, 2, 16), QTime(9, 30) } });

    const auto result = m_engine->expand(event, utc(2026, 2, 1), utc(2026, 3, 1));
    QVERIFY(result.ok());
    const auto &occurrences = result.value();
    QCOMPARE(int(occurrences.size()), 3);
    QCOMPARE(occurrences[1].interval, occurrences[2].interval);

    QStringList ids;
    for (const Occurrence &occurrence : occurrences) {
        ids << occurrence.id();
    }
    ids.sort();
    QCOMPARE(ids, (QStringList{ QStringLiteral("standup@20260202T140000Z"), QStringLiteral("standup@20260216T140000Z"),
                                QStringLiteral("standup@20260216T140000Z/20260209") }));
}

void RecurrenceEngineTest::nonRecurringExpandsToSingleInterval()
{
    const EventTemplate event = makeEvent(QDate(2026, 5, 4), QTime(13, 0), QTime(14, 30),
                                          QStringLiteral("America/New_York"));

    const auto inside = m_engine->expand(event, utc(2026, 5, 1), utc(2026, 6, 1));
    QVERIFY(inside.ok());
    QCOMPARE(int(inside.value().size()), 1);
    QCOMPARE(inside.value().front().interval, (TimeInterval{ utc(2026, 5, 4, 17), utc(2026, 5, 4, 18, 30) }));

    const auto outside = m_engine->expand(event, utc(2026, 6, 1), utc(2026, 7, 1));
    QVERIFY(outside.ok());
    QVERIFY(outside.value().empty());

    const auto open = m_engine->expand(event, utc(2026, 5, 1), QDateTime());
    QVERIFY(open.ok());
    QCOMPARE(int(open.value().size()), 1);
}

void RecurrenceEngineTest::unboundedExpansionIsRejected()
{
    const EventTemplate event = makeEvent(QDate(2026, 4, 1), QTime(10, 0), QTime(11, 0), QStringLiteral("UTC"),
                                          QStringLiteral("FREQ=DAILY"));

    const auto unbounded = m_engine->expand(event, utc(2026, 4, 1), QDateTime());
    QVERIFY(!unbounded.ok());
    QCOMPARE(unbounded.error().code, ErrorCode::UnboundedExpansion);

    const auto bounded = m_engine->expand(event, utc(2026, 4, 1), utc(2026, 4, 8));
    QVERIFY(bounded.ok());
    QCOMPARE(int(bounded.value().size()), 7);

    // Far from the start: whole periods are skipped, not generated.
    const auto distant = m_engine->expand(event, utc(2126, 4, 1), utc(2126, 4, 3));
    QVERIFY(distant.ok());
    QCOMPARE(int(distant.value().size()), 2);
}

void RecurrenceEngineTest::invalidTemplatesAreRejected()
{
    const EventTemplate inverted = makeEvent(QDate(2026, 4, 1), QTime(11, 0), QTime(10, 0), QStringLiteral("UTC"));
    const auto invertedResult = m_engine->expand(inverted, utc(2026, 4, 1), utc(2026, 5, 1));
    QVERIFY(!invertedResult.ok());
    QCOMPARE(invertedResult.error().code, ErrorCode::InvalidTemplate);

    const EventTemplate unknownZone = makeEvent(QDate(2026, 4, 1), QTime(10, 0), QTime(11, 0),
                                                QStringLiteral("Europe/Atlantis"), QStringLiteral("FREQ=DAILY;COUNT=2"));
    const auto zoneResult = m_engine->expand(unknownZone, utc(2026, 4, 1), utc(2026, 5, 1));
    QVERIFY(!zoneResult.ok());
    QCOMPARE(zoneResult.error().code, ErrorCode::InvalidTimezone);

    const EventTemplate event = makeEvent(QDate(2026, 4, 1), QTime(10, 0), QTime(11, 0), QStringLiteral("UTC"));
    const auto emptyRange = m_engine->expand(event, utc(2026, 5, 1), utc(2026, 4, 1));
    QVERIFY(!emptyRange.ok());
    QCOMPARE(emptyRange.error().code, ErrorCode::InvalidInterval);
}

void RecurrenceEngineTest::cursorReplaysIdenticalSequence()
{
    const EventTemplate event = makeEvent(QDate(2026, 1, 6), QTime(9, 0), QTime(9, 30),
                                          QStringLiteral("America/New_York"),
                                          QStringLiteral("FREQ=MONTHLY;BYDAY=1TU,-1FR;COUNT=8"));

    auto cursor = m_engine->cursor(event, utc(2026, 1, 1), QDateTime());
    QVERIFY(cursor.ok());

    std::vector<Occurrence> firstRun;
    while (auto occurrence = cursor.value().next()) {
        firstRun.push_back(*occurrence);
    }
    QVERIFY(cursor.value().finished());
    QCOMPARE(int(firstRun.size()), 8);

    cursor.value().reset();
    std::vector<Occurrence> secondRun;
    while (auto occurrence = cursor.value().next()) {
        secondRun.push_back(*occurrence);
    }
    QCOMPARE(int(secondRun.size()), int(firstRun.size()));
    for (std::size_t i = 0; i < firstRun.size(); ++i) {
        QCOMPARE(secondRun[i].interval, firstRun[i].interval);
    }

    const auto expanded = m_engine->expand(event, utc(2026, 1, 1), QDateTime());
    QVERIFY(expanded.ok());
    QCOMPARE(expanded.value().front().interval, firstRun.front().interval);
    QCOMPARE(expanded.value().back().interval, firstRun.back().interval);
}

void RecurrenceEngineTest::nextOccurrenceIsStrictlyAfter()
{
    const EventTemplate event = makeEvent(QDate(2026, 2, 2), QTime(9, 0), QTime(9, 30),
                                          QStringLiteral("America/New_York"),
                                          QStringLiteral("FREQ=WEEKLY;BYDAY=MO;COUNT=3"));

    const auto fromStart = m_engine->nextOccurrence(event, utc(2026, 2, 2, 14));
    QVERIFY(fromStart.ok());
    QVERIFY(fromStart.value().has_value());
    QCOMPARE(fromStart.value()->interval.start, utc(2026, 2, 9, 14));

    const auto before = m_engine->nextOccurrence(event, utc(2026, 1, 1));
    QVERIFY(before.ok());
    QCOMPARE(before.value()->interval.start, utc(2026, 2, 2, 14));

    const auto exhausted = m_engine->nextOccurrence(event, utc(2026, 2, 16, 14));
    QVERIFY(exhausted.ok());
    QVERIFY(!exhausted.value().has_value());

    // Unbounded rules are fine here: the search stops at the first hit.
    const EventTemplate daily = makeEvent(QDate(2026, 4, 1), QTime(10, 0), QTime(11, 0), QStringLiteral("UTC"),
                                          QStringLiteral("FREQ=DAILY"));
    const auto next = m_engine->nextOccurrence(daily, utc(2030, 6, 15, 12));
    QVERIFY(next.ok());
    QCOMPARE(next.value()->interval.start, utc(2030, 6, 16, 10));

    EventTemplate moved = event;
    moved.overrides.push_back(OccurrenceOverride{ QDate(2026, 2, 16), LocalDateTime{ QDate(2026, 2, 3), QTime(9, 0) },
                                                  LocalDateTime{ QDate(2026, 2, 3), QTime(9, 30) } });
    const auto early = m_engine->nextOccurrence(moved, utc(2026, 2, 2, 15));
    QVERIFY(early.ok());
    QCOMPARE(early.value()->interval.start, utc(2026, 2, 3, 14));
    QVERIFY(early.value()->isException);
}

QTEST_MAIN(RecurrenceEngineTest)
#include "RecurrenceEngineTest.moc"
