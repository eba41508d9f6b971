#include "agenda/core/RecurrenceEngine.hpp"

#include <algorithm>
#include <cstdlib>
#include <utility>

#include "agenda/core/Logging.hpp"
#include "agenda/core/TimezoneResolver.hpp"

namespace agenda {
namespace core {

namespace {
constexpr int MaxMonthOrdinal = 5;
constexpr int MaxYearOrdinal = 53;
} // namespace

RecurrenceEngine::RecurrenceEngine(const TimezoneResolver &resolver, int maxPeriods)
    : m_resolver(resolver)
    , m_maxPeriods(maxPeriods)
{
}

std::optional<RuleError> RecurrenceEngine::validate(const data::RecurrenceRule &rule)
{
    if (rule.until && rule.count) {
        return RuleError::ConflictingTerminators;
    }
    if (rule.interval < 1) {
        return RuleError::InvalidInterval;
    }
    if (rule.count && *rule.count < 1) {
        return RuleError::InvalidCount;
    }
    if (rule.byWeekday) {
        if (rule.byWeekday->empty()) {
            return RuleError::EmptyByWeekday;
        }
        const bool periodIsYear = rule.frequency == data::Frequency::Yearly && !rule.byMonth && !rule.byMonthDay;
        const int limit = periodIsYear ? MaxYearOrdinal : MaxMonthOrdinal;
        for (const data::WeekdayNum &entry : *rule.byWeekday) {
            if (entry.ordinal == 0) {
                continue;
            }
            if (rule.frequency == data::Frequency::Daily || rule.frequency == data::Frequency::Weekly) {
                return RuleError::InvalidOrdinal;
            }
            if (std::abs(entry.ordinal) > limit) {
                return RuleError::InvalidOrdinal;
            }
        }
    }
    if (rule.byMonthDay) {
        if (rule.byMonthDay->empty()) {
            return RuleError::InvalidMonthDay;
        }
        for (int monthDay : *rule.byMonthDay) {
            if (monthDay == 0 || monthDay < -31 || monthDay > 31) {
                return RuleError::InvalidMonthDay;
            }
        }
    }
    if (rule.byMonth) {
        if (rule.byMonth->empty()) {
            return RuleError::InvalidMonth;
        }
        for (int month : *rule.byMonth) {
            if (month < 1 || month > 12) {
                return RuleError::InvalidMonth;
            }
        }
    }
    return std::nullopt;
}

Result<OccurrenceCursor> RecurrenceEngine::cursor(const data::EventTemplate &event, const QDateTime &rangeStart,
                                                  const QDateTime &rangeEnd, ClipMode clip) const
{
    auto zone = prepare(event);
    if (!zone) {
        return zone.error();
    }
    if (rangeStart.isValid() && rangeEnd.isValid() && !(rangeStart < rangeEnd)) {
        return ScheduleError::invalidInterval(QStringLiteral("range start must precede range end"));
    }
    if (!rangeEnd.isValid() && event.recurrence && !event.recurrence->until && !event.recurrence->count) {
        qCDebug(AGENDA_RECURRENCE_LOG) << "Refusing open-ended expansion of" << event.id;
        return ScheduleError::unboundedExpansion(
            QStringLiteral("event '%1' has neither UNTIL nor COUNT and the range has no end").arg(event.id));
    }
    return OccurrenceCursor(event, std::move(zone).value(), m_resolver, rangeStart, rangeEnd, clip, m_maxPeriods);
}

Result<std::vector<data::Occurrence>> RecurrenceEngine::expand(const data::EventTemplate &event,
                                                               const QDateTime &rangeStart,
                                                               const QDateTime &rangeEnd) const
{
    return collect(event, rangeStart, rangeEnd, ClipMode::Overlap);
}

Result<std::vector<data::Occurrence>> RecurrenceEngine::occurrencesBetween(const data::EventTemplate &event,
                                                                           const QDateTime &rangeStart,
                                                                           const QDateTime &rangeEnd) const
{
    return collect(event, rangeStart, rangeEnd, ClipMode::StartWithin);
}

Result<std::optional<data::Occurrence>> RecurrenceEngine::nextOccurrence(const data::EventTemplate &event,
                                                                         const QDateTime &after) const
{
    auto zone = prepare(event);
    if (!zone) {
        return zone.error();
    }
    if (!after.isValid()) {
        return ScheduleError::invalidInterval(QStringLiteral("invalid reference instant"));
    }

    OccurrenceCursor series(event, std::move(zone).value(), m_resolver, after, QDateTime(), ClipMode::StartWithin,
                            m_maxPeriods);
    std::optional<data::Occurrence> best;
    while (auto instance = series.nextInSeries()) {
        const data::Occurrence &occurrence = instance->occurrence;
        if (occurrence.interval.start > after && (!best || occurrence.interval.start < best->interval.start)) {
            best = occurrence;
        }
        // Natural starts only grow; only an override can still come earlier.
        if (best && instance->naturalStart >= best->interval.start
            && !series.overridePendingWithin(occurrence.recurrenceDate, after, best->interval.start)) {
            break;
        }
    }
    return best;
}

Result<QTimeZone> RecurrenceEngine::prepare(const data::EventTemplate &event) const
{
    const auto zone = m_resolver.zone(event.timezone);
    if (!zone) {
        qCDebug(AGENDA_RECURRENCE_LOG) << "Event" << event.id << "uses unknown zone" << event.timezone;
        return ScheduleError::invalidTimezone(event.timezone);
    }
    if (!event.startLocal.isValid() || !event.endLocal.isValid()) {
        return ScheduleError::invalidTemplate(QStringLiteral("event '%1' has an invalid start or end").arg(event.id));
    }
    if (event.durationSecs() <= 0) {
        return ScheduleError::invalidTemplate(QStringLiteral("event '%1' must end after it starts").arg(event.id));
    }
    if (event.recurrence) {
        if (const auto error = validate(*event.recurrence)) {
            return ScheduleError::fromRule(*error, QStringLiteral("event '%1'").arg(event.id));
        }
    }
    return *zone;
}

Result<std::vector<data::Occurrence>> RecurrenceEngine::collect(const data::EventTemplate &event,
                                                                const QDateTime &rangeStart,
                                                                const QDateTime &rangeEnd, ClipMode clip) const
{
    auto series = cursor(event, rangeStart, rangeEnd, clip);
    if (!series) {
        return series.error();
    }

    std::vector<data::Occurrence> occurrences;
    while (auto occurrence = series.value().next()) {
        occurrences.push_back(std::move(*occurrence));
    }
    // Overrides may move an instance past its neighbours.
    std::stable_sort(occurrences.begin(), occurrences.end(), [](const data::Occurrence &lhs, const data::Occurrence &rhs) {
        return lhs.interval.start < rhs.interval.start;
    });
    qCDebug(AGENDA_RECURRENCE_LOG) << "Expanded" << event.id << "to" << occurrences.size() << "occurrences";
    return occurrences;
}

} // namespace core
} // namespace agenda
