#include "agenda/core/OccurrenceCursor.hpp"

#include <algorithm>
#include <utility>

#include "agenda/core/Logging.hpp"
#include "agenda/core/TimezoneResolver.hpp"

namespace agenda {
namespace core {

namespace {
constexpr qint64 SecsPerDay = 24 * 60 * 60;
constexpr int MaxYear = 9999;

int daysFromWeekStart(int dayOfWeek, Qt::DayOfWeek weekStart)
{
    return (dayOfWeek - static_cast<int>(weekStart) + 7) % 7;
}

QDate weekStartOf(const QDate &date, Qt::DayOfWeek weekStart)
{
    return date.addDays(-daysFromWeekStart(date.dayOfWeek(), weekStart));
}

// Resolves a BYMONTHDAY value against a month of `length` days; 0 if absent.
int resolveMonthDay(int monthDay, int length)
{
    const int day = monthDay > 0 ? monthDay : length + monthDay + 1;
    return day >= 1 && day <= length ? day : 0;
}

// n-th (or n-th from last, for negative n) weekday within [first, first + length).
QDate nthWeekday(const QDate &first, int length, Qt::DayOfWeek weekday, int ordinal)
{
    if (ordinal > 0) {
        const int offset = (static_cast<int>(weekday) - first.dayOfWeek() + 7) % 7 + (ordinal - 1) * 7;
        return offset < length ? first.addDays(offset) : QDate();
    }
    const QDate last = first.addDays(length - 1);
    const int offset = (last.dayOfWeek() - static_cast<int>(weekday) + 7) % 7 + (-ordinal - 1) * 7;
    return offset < length ? last.addDays(-offset) : QDate();
}

void appendWeekdaysInScope(const std::vector<data::WeekdayNum> &entries, const QDate &first, int length,
                           std::vector<QDate> &dates)
{
    for (const data::WeekdayNum &entry : entries) {
        if (entry.ordinal != 0) {
            const QDate date = nthWeekday(first, length, entry.weekday, entry.ordinal);
            if (date.isValid()) {
                dates.push_back(date);
            }
            continue;
        }
        for (QDate date = nthWeekday(first, length, entry.weekday, 1);
             date.isValid() && first.daysTo(date) < length; date = date.addDays(7)) {
            dates.push_back(date);
        }
    }
}

bool matchesWeekdayInScope(const std::vector<data::WeekdayNum> &entries, const QDate &date, const QDate &first,
                           int length)
{
    const int dayIndex = static_cast<int>(first.daysTo(date)) + 1;
    for (const data::WeekdayNum &entry : entries) {
        if (static_cast<int>(entry.weekday) != date.dayOfWeek()) {
            continue;
        }
        if (entry.ordinal == 0) {
            return true;
        }
        if (entry.ordinal > 0 && (dayIndex - 1) / 7 + 1 == entry.ordinal) {
            return true;
        }
        if (entry.ordinal < 0 && (length - dayIndex) / 7 + 1 == -entry.ordinal) {
            return true;
        }
    }
    return false;
}

std::vector<QDate> datesInMonth(const data::RecurrenceRule &rule, const QDate &first, const QDate &anchor)
{
    std::vector<QDate> dates;
    const int length = first.daysInMonth();
    if (rule.byMonthDay) {
        for (int monthDay : *rule.byMonthDay) {
            const int day = resolveMonthDay(monthDay, length);
            if (day == 0) {
                continue;
            }
            const QDate date(first.year(), first.month(), day);
            if (!rule.byWeekday || matchesWeekdayInScope(*rule.byWeekday, date, first, length)) {
                dates.push_back(date);
            }
        }
    } else if (rule.byWeekday) {
        appendWeekdaysInScope(*rule.byWeekday, first, length, dates);
    } else if (anchor.day() <= length) {
        // Day 31 in a 30-day month is skipped, not clamped.
        dates.emplace_back(first.year(), first.month(), anchor.day());
    }
    return dates;
}

// BYMONTH / BYMONTHDAY only restrict for DAILY and WEEKLY.
bool passesMonthFilters(const data::RecurrenceRule &rule, const QDate &date)
{
    if (rule.byMonth
        && std::find(rule.byMonth->begin(), rule.byMonth->end(), date.month()) == rule.byMonth->end()) {
        return false;
    }
    if (rule.byMonthDay) {
        return std::any_of(rule.byMonthDay->begin(), rule.byMonthDay->end(), [&](int monthDay) {
            return resolveMonthDay(monthDay, date.daysInMonth()) == date.day();
        });
    }
    return true;
}

bool passesDailyFilters(const data::RecurrenceRule &rule, const QDate &date)
{
    if (!passesMonthFilters(rule, date)) {
        return false;
    }
    if (!rule.byWeekday) {
        return true;
    }
    return std::any_of(rule.byWeekday->begin(), rule.byWeekday->end(), [&](const data::WeekdayNum &entry) {
        return static_cast<int>(entry.weekday) == date.dayOfWeek();
    });
}
} // namespace

OccurrenceCursor::OccurrenceCursor(data::EventTemplate event, QTimeZone zone, const TimezoneResolver &resolver,
                                   QDateTime rangeStart, QDateTime rangeEnd, ClipMode clip, int maxPeriods)
    : m_event(std::move(event))
    , m_zone(std::move(zone))
    , m_resolver(&resolver)
    , m_rangeStart(std::move(rangeStart))
    , m_rangeEnd(std::move(rangeEnd))
    , m_clip(clip)
    , m_maxPeriods(maxPeriods)
{
    for (const data::OccurrenceOverride &moved : m_event.overrides) {
        const QDateTime start = m_resolver->resolveIn(moved.startLocal, m_zone).instant;
        QDateTime end = m_resolver->resolveIn(moved.endLocal, m_zone).instant;
        if (!(start < end)) {
            end = start.addSecs(m_event.durationSecs());
        }
        m_overrides[moved.originalDate] = data::TimeInterval{ start, end };
    }
    m_firstPeriod = firstRelevantPeriod();
    m_period = m_firstPeriod;
}

std::optional<data::Occurrence> OccurrenceCursor::next()
{
    while (auto instance = nextInSeries()) {
        const data::Occurrence &occurrence = instance->occurrence;
        if (inRange(occurrence.interval)) {
            return occurrence;
        }
        if (m_rangeEnd.isValid() && instance->naturalStart >= m_rangeEnd && occurrence.interval.start >= m_rangeEnd
            && !overridePendingWithin(occurrence.recurrenceDate, QDateTime(), m_rangeEnd)) {
            m_done = true;
            break;
        }
    }
    return std::nullopt;
}

std::optional<OccurrenceCursor::Instance> OccurrenceCursor::nextInSeries()
{
    if (m_done) {
        return std::nullopt;
    }

    if (!m_event.recurrence) {
        m_done = true;
        const QDateTime start = m_resolver->resolveIn(m_event.startLocal, m_zone).instant;
        ++m_emitted;
        return makeInstance(m_event.startLocal.date, start);
    }

    const data::RecurrenceRule &rule = *m_event.recurrence;
    int emptyPeriods = 0;
    while (true) {
        if (rule.count && m_emitted >= *rule.count) {
            m_done = true;
            return std::nullopt;
        }

        if (m_candidateIndex >= m_candidates.size()) {
            if (emptyPeriods >= m_maxPeriods) {
                qCWarning(AGENDA_RECURRENCE_LOG) << "Event" << m_event.id << "produced no candidate in"
                                                 << emptyPeriods << "periods, stopping";
                m_done = true;
                return std::nullopt;
            }
            auto candidates = candidatesForPeriod(m_period++);
            if (!candidates) {
                m_done = true;
                return std::nullopt;
            }
            m_candidates = std::move(*candidates);
            m_candidateIndex = 0;
            emptyPeriods = m_candidates.empty() ? emptyPeriods + 1 : 0;
            continue;
        }

        const QDate date = m_candidates[m_candidateIndex++];
        const data::LocalDateTime local{ date, m_event.startLocal.time };
        if (local < m_event.startLocal) {
            continue;
        }
        const QDateTime naturalStart = m_resolver->resolveIn(local, m_zone).instant;
        if (pastUntil(local, naturalStart)) {
            m_done = true;
            return std::nullopt;
        }
        if (rule.exceptions.count(date) > 0) {
            continue;
        }
        ++m_emitted;
        return makeInstance(date, naturalStart);
    }
}

bool OccurrenceCursor::overridePendingWithin(const QDate &after, const QDateTime &lower, const QDateTime &upper) const
{
    for (auto it = m_overrides.upper_bound(after); it != m_overrides.end(); ++it) {
        const QDateTime &start = it->second.start;
        if ((!lower.isValid() || start > lower) && start < upper) {
            return true;
        }
    }
    return false;
}

void OccurrenceCursor::reset()
{
    m_period = m_firstPeriod;
    m_candidates.clear();
    m_candidateIndex = 0;
    m_emitted = 0;
    m_done = false;
}

bool OccurrenceCursor::finished() const
{
    return m_done;
}

std::optional<std::vector<QDate>> OccurrenceCursor::candidatesForPeriod(qint64 period) const
{
    const data::RecurrenceRule &rule = *m_event.recurrence;
    const QDate anchor = m_event.startLocal.date;
    const qint64 step = period * rule.interval;
    std::vector<QDate> dates;

    switch (rule.frequency) {
    case data::Frequency::Daily: {
        const QDate day = anchor.addDays(step);
        if (!day.isValid() || day.year() > MaxYear) {
            return std::nullopt;
        }
        if (passesDailyFilters(rule, day)) {
            dates.push_back(day);
        }
        break;
    }
    case data::Frequency::Weekly: {
        const QDate weekBegin = weekStartOf(anchor, rule.weekStart).addDays(step * 7);
        if (!weekBegin.isValid() || weekBegin.year() > MaxYear) {
            return std::nullopt;
        }
        if (rule.byWeekday) {
            for (const data::WeekdayNum &entry : *rule.byWeekday) {
                dates.push_back(weekBegin.addDays(daysFromWeekStart(entry.weekday, rule.weekStart)));
            }
        } else {
            dates.push_back(weekBegin.addDays(daysFromWeekStart(anchor.dayOfWeek(), rule.weekStart)));
        }
        dates.erase(std::remove_if(dates.begin(), dates.end(),
                                   [&](const QDate &date) { return !passesMonthFilters(rule, date); }),
                    dates.end());
        break;
    }
    case data::Frequency::Monthly: {
        const qint64 months = anchor.month() - 1 + step;
        const qint64 year = anchor.year() + months / 12;
        if (year > MaxYear) {
            return std::nullopt;
        }
        const QDate first(static_cast<int>(year), static_cast<int>(months % 12) + 1, 1);
        if (!rule.byMonth
            || std::find(rule.byMonth->begin(), rule.byMonth->end(), first.month()) != rule.byMonth->end()) {
            dates = datesInMonth(rule, first, anchor);
        }
        break;
    }
    case data::Frequency::Yearly: {
        const qint64 year = anchor.year() + step;
        if (year > MaxYear) {
            return std::nullopt;
        }
        const QDate january(static_cast<int>(year), 1, 1);
        if (rule.byMonth) {
            for (int month : *rule.byMonth) {
                const auto inMonth = datesInMonth(rule, QDate(january.year(), month, 1), anchor);
                dates.insert(dates.end(), inMonth.begin(), inMonth.end());
            }
        } else if (rule.byMonthDay) {
            for (int month = 1; month <= 12; ++month) {
                const auto inMonth = datesInMonth(rule, QDate(january.year(), month, 1), anchor);
                dates.insert(dates.end(), inMonth.begin(), inMonth.end());
            }
        } else if (rule.byWeekday) {
            appendWeekdaysInScope(*rule.byWeekday, january, january.daysInYear(), dates);
        } else {
            dates = datesInMonth(rule, QDate(january.year(), anchor.month(), 1), anchor);
        }
        break;
    }
    }

    std::sort(dates.begin(), dates.end());
    dates.erase(std::unique(dates.begin(), dates.end()), dates.end());
    return dates;
}

// Skips whole periods that cannot reach the range. Only valid without COUNT,
// which must be counted from the first period.
qint64 OccurrenceCursor::firstRelevantPeriod() const
{
    if (!m_event.recurrence || m_event.recurrence->count || !m_rangeStart.isValid()) {
        return 0;
    }
    const data::RecurrenceRule &rule = *m_event.recurrence;
    QDate target = TimezoneResolver::localIn(m_rangeStart, m_zone).date;
    for (const auto &moved : m_overrides) {
        target = std::min(target, moved.first);
    }
    target = target.addDays(-(m_event.durationSecs() / SecsPerDay) - 2);

    const QDate anchor = m_event.startLocal.date;
    if (target <= anchor) {
        return 0;
    }
    qint64 units = 0;
    switch (rule.frequency) {
    case data::Frequency::Daily:
        units = anchor.daysTo(target);
        break;
    case data::Frequency::Weekly:
        units = weekStartOf(anchor, rule.weekStart).daysTo(target) / 7;
        break;
    case data::Frequency::Monthly:
        units = qint64(target.year() - anchor.year()) * 12 + (target.month() - anchor.month());
        break;
    case data::Frequency::Yearly:
        units = target.year() - anchor.year();
        break;
    }
    return std::max<qint64>(0, units / rule.interval - 1);
}

bool OccurrenceCursor::pastUntil(const data::LocalDateTime &local, const QDateTime &instant) const
{
    const auto &until = m_event.recurrence->until;
    if (!until) {
        return false;
    }
    switch (until->form) {
    case data::UntilForm::Date:
        return local.date > until->date;
    case data::UntilForm::FloatingDateTime:
        return data::LocalDateTime{ until->date, until->time } < local;
    case data::UntilForm::UtcDateTime:
    default:
        return instant > until->instant();
    }
}

bool OccurrenceCursor::inRange(const data::TimeInterval &interval) const
{
    if (m_clip == ClipMode::StartWithin) {
        return (!m_rangeStart.isValid() || interval.start >= m_rangeStart)
            && (!m_rangeEnd.isValid() || interval.start < m_rangeEnd);
    }
    return (!m_rangeStart.isValid() || interval.end > m_rangeStart)
        && (!m_rangeEnd.isValid() || interval.start < m_rangeEnd);
}

OccurrenceCursor::Instance OccurrenceCursor::makeInstance(const QDate &date, const QDateTime &naturalStart) const
{
    data::Occurrence occurrence;
    occurrence.sourceEventId = m_event.id;
    occurrence.recurrenceDate = date;
    occurrence.createdAt = m_event.createdAt;

    const auto moved = m_overrides.find(date);
    if (moved != m_overrides.end()) {
        occurrence.interval = moved->second;
        occurrence.isException = true;
    } else {
        occurrence.interval = data::TimeInterval::fromStart(naturalStart, m_event.durationSecs());
    }
    return Instance{ occurrence, naturalStart };
}

} // namespace core
} // namespace agenda
