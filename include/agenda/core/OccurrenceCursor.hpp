#pragma once

#include <QDate>
#include <QDateTime>
#include <QTimeZone>
#include <cstddef>
#include <map>
#include <optional>
#include <vector>

#include "agenda/data/EventTemplate.hpp"
#include "agenda/data/Occurrence.hpp"

namespace agenda {
namespace core {

class TimezoneResolver;

enum class ClipMode
{
    Overlap,     // occurrence touches the range
    StartWithin, // occurrence starts inside the range
};

// Lazy, restartable generator over one event's occurrences.
//
// Candidates are produced period by period in wall-clock space and only
// then resolved to instants. COUNT is always counted from the first
// occurrence of the series, whatever the query range is. A cursor is a pure
// function of its constructor arguments: reset() replays the same sequence.
class OccurrenceCursor
{
public:
    struct Instance
    {
        data::Occurrence occurrence;
        QDateTime naturalStart; // start before any override is applied
    };

    OccurrenceCursor(data::EventTemplate event, QTimeZone zone, const TimezoneResolver &resolver,
                     QDateTime rangeStart, QDateTime rangeEnd, ClipMode clip, int maxPeriods);

    // Next occurrence inside the range, in series order.
    std::optional<data::Occurrence> next();

    // Next member of the series regardless of the range.
    std::optional<Instance> nextInSeries();

    // True if an override for a date after `after` moves an instance to a
    // start inside (lower, upper). An invalid lower bound is open.
    bool overridePendingWithin(const QDate &after, const QDateTime &lower, const QDateTime &upper) const;

    void reset();
    bool finished() const;

private:
    std::optional<std::vector<QDate>> candidatesForPeriod(qint64 period) const;
    qint64 firstRelevantPeriod() const;
    bool pastUntil(const data::LocalDateTime &local, const QDateTime &instant) const;
    bool inRange(const data::TimeInterval &interval) const;
    Instance makeInstance(const QDate &date, const QDateTime &naturalStart) const;

    data::EventTemplate m_event;
    QTimeZone m_zone;
    const TimezoneResolver *m_resolver;
    QDateTime m_rangeStart;
    QDateTime m_rangeEnd;
    ClipMode m_clip;
    int m_maxPeriods;
    std::map<QDate, data::TimeInterval> m_overrides;
    qint64 m_firstPeriod = 0;

    qint64 m_period = 0;
    std::vector<QDate> m_candidates;
    std::size_t m_candidateIndex = 0;
    int m_emitted = 0;
    bool m_done = false;
};

} // namespace core
} // namespace agenda
