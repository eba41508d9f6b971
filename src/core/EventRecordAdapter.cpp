#include "agenda/core/EventRecordAdapter.hpp"

#include <QRegularExpression>
#include <QTimeZone>
#include <optional>
#include <utility>

#include "agenda/core/Logging.hpp"
#include "agenda/core/RecurrenceEngine.hpp"
#include "agenda/core/TimezoneResolver.hpp"
#include "agenda/data/RRuleCodec.hpp"

namespace agenda {
namespace core {

namespace {
constexpr auto COMPACT_DATE_FORMAT = "yyyyMMdd";

std::optional<QDate> parseDate(const QString &text)
{
    QDate date = QDate::fromString(text, Qt::ISODate);
    if (!date.isValid() && text.size() == 8) {
        date = QDate::fromString(text, QLatin1String(COMPACT_DATE_FORMAT));
    }
    if (!date.isValid()) {
        return std::nullopt;
    }
    return date;
}

// Accepts "2026-02-02", "2026-02-02T09:00[:00]", "20260202T090000" and the
// same with a Z or +hh:mm suffix. Suffixed values are instants and land on
// the zone's wall clock.
std::optional<data::LocalDateTime> parseDateTime(const QString &value, const QTimeZone &zone)
{
    const QString text = value.trimmed();
    const int separator = text.indexOf(QLatin1Char('T'));
    if (separator < 0) {
        const auto date = parseDate(text);
        if (!date) {
            return std::nullopt;
        }
        return data::LocalDateTime{ *date, QTime(0, 0) };
    }

    static const QRegularExpression compact(QStringLiteral("^(\\d{8})T(\\d{6})(Z?)$"));
    const QRegularExpressionMatch compactMatch = compact.match(text);
    if (compactMatch.hasMatch()) {
        const data::LocalDateTime local{ QDate::fromString(compactMatch.captured(1), QLatin1String(COMPACT_DATE_FORMAT)),
                                         QTime::fromString(compactMatch.captured(2), QStringLiteral("hhmmss")) };
        if (!local.isValid()) {
            return std::nullopt;
        }
        if (compactMatch.captured(3).isEmpty()) {
            return local;
        }
        return TimezoneResolver::localIn(QDateTime(local.date, local.time, Qt::UTC), zone);
    }

    static const QRegularExpression offsetSuffix(QStringLiteral("(Z|[+-]\\d{2}(:?\\d{2})?)$"));
    if (offsetSuffix.match(text.mid(separator + 1)).hasMatch()) {
        const QDateTime instant = QDateTime::fromString(text, Qt::ISODate);
        if (!instant.isValid()) {
            return std::nullopt;
        }
        return TimezoneResolver::localIn(instant.toUTC(), zone);
    }

    const auto date = parseDate(text.left(separator));
    const QTime time = QTime::fromString(text.mid(separator + 1), Qt::ISODate);
    if (!date || !time.isValid()) {
        return std::nullopt;
    }
    return data::LocalDateTime{ *date, time };
}
} // namespace

EventRecordAdapter::EventRecordAdapter(const TimezoneResolver &resolver)
    : m_resolver(resolver)
{
}

Result<data::EventTemplate> EventRecordAdapter::toTemplate(const data::EventRecord &record) const
{
    const auto zone = m_resolver.zone(record.timezone);
    if (!zone) {
        qCWarning(AGENDA_DATA_LOG) << "Record" << record.id << "has unknown zone" << record.timezone;
        return ScheduleError::invalidTimezone(record.timezone);
    }

    data::EventTemplate event;
    event.id = record.id;
    event.timezone = record.timezone;

    const auto start = parseDateTime(record.startTime, *zone);
    const auto end = parseDateTime(record.endTime, *zone);
    if (!start || !end) {
        return ScheduleError::invalidTemplate(
            QStringLiteral("record '%1' has an unreadable startTime or endTime").arg(record.id));
    }
    if (!(*start < *end)) {
        return ScheduleError::invalidTemplate(QStringLiteral("record '%1' ends before it starts").arg(record.id));
    }
    event.startLocal = *start;
    event.endLocal = *end;

    if (!record.rrule.isEmpty()) {
        auto rule = data::RRuleCodec::parse(record.rrule);
        if (!rule) {
            return ScheduleError::fromRule(rule.error(), QStringLiteral("record '%1'").arg(record.id));
        }
        if (const auto error = RecurrenceEngine::validate(rule.value())) {
            return ScheduleError::fromRule(*error, QStringLiteral("record '%1'").arg(record.id));
        }
        event.recurrence = std::move(rule).value();
    }

    for (const QString &exdate : record.exdates) {
        if (!event.recurrence) {
            return ScheduleError::invalidTemplate(
                QStringLiteral("record '%1' lists exdates without an rrule").arg(record.id));
        }
        // Instants excluded by a Z or offset form belong to the zone's local date.
        const auto excluded = parseDateTime(exdate, *zone);
        if (!excluded) {
            return ScheduleError::invalidTemplate(
                QStringLiteral("record '%1' has an unreadable exdate '%2'").arg(record.id, exdate));
        }
        event.recurrence->exceptions.insert(excluded->date);
    }

    if (!record.createdAt.isEmpty()) {
        event.createdAt = QDateTime::fromString(record.createdAt, Qt::ISODate).toUTC();
        if (!event.createdAt.isValid()) {
            return ScheduleError::invalidTemplate(
                QStringLiteral("record '%1' has an unreadable createdAt").arg(record.id));
        }
    }
    return event;
}

data::EventRecord EventRecordAdapter::toRecord(const data::EventTemplate &event) const
{
    data::EventRecord record;
    record.id = event.id;
    record.startTime = event.startLocal.toString();
    record.endTime = event.endLocal.toString();
    record.timezone = event.timezone;
    if (event.recurrence) {
        record.rrule = data::RRuleCodec::format(*event.recurrence);
        for (const QDate &date : event.recurrence->exceptions) {
            record.exdates << date.toString(Qt::ISODate);
        }
    }
    if (event.createdAt.isValid()) {
        record.createdAt = event.createdAt.toUTC().toString(Qt::ISODate);
    }
    return record;
}

} // namespace core
} // namespace agenda
