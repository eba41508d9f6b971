#include "agenda/core/AvailabilityEngine.hpp"

#include <algorithm>
#include <optional>
#include <utility>

#include "agenda/core/Logging.hpp"
#include "agenda/core/TimezoneResolver.hpp"

namespace agenda {
namespace core {

namespace {
int restriction(data::AvailabilityStatus status)
{
    switch (status) {
    case data::AvailabilityStatus::OutOfOffice:
        return 3;
    case data::AvailabilityStatus::Busy:
        return 2;
    case data::AvailabilityStatus::Tentative:
        return 1;
    case data::AvailabilityStatus::Free:
    default:
        return 0;
    }
}

std::optional<data::TimeInterval> clipTo(const data::TimeInterval &interval, const data::TimeInterval &range)
{
    if (!interval.isValid() || !interval.overlaps(range)) {
        return std::nullopt;
    }
    return data::TimeInterval{ std::max(interval.start, range.start), std::min(interval.end, range.end) };
}

// Walks sorted, disjoint intervals alongside ascending instants.
class IntervalWalker
{
public:
    explicit IntervalWalker(const std::vector<data::TimeInterval> &intervals)
        : m_intervals(intervals)
    {
    }

    bool contains(const QDateTime &instant)
    {
        while (m_next < m_intervals.size() && m_intervals[m_next].end <= instant) {
            ++m_next;
        }
        return m_next < m_intervals.size() && m_intervals[m_next].start <= instant;
    }

private:
    const std::vector<data::TimeInterval> &m_intervals;
    std::size_t m_next = 0;
};
} // namespace

AvailabilityEngine::AvailabilityEngine(const TimezoneResolver &resolver)
    : m_resolver(resolver)
{
}

Result<std::vector<data::AvailabilityWindow>> AvailabilityEngine::getAvailability(
    const std::vector<data::TimeInterval> &busy, const std::vector<data::AvailabilityWindow> &explicitWindows,
    const std::vector<data::WorkingHoursRule> &workingHours, const data::TimeInterval &range) const
{
    if (!range.isValid()) {
        return ScheduleError::invalidInterval(QStringLiteral("availability range must be non-empty"));
    }

    std::vector<data::TimeInterval> working;
    if (workingHours.empty()) {
        working.push_back(range);
    } else {
        auto intervals = workingIntervals(workingHours, range);
        if (!intervals) {
            return intervals.error();
        }
        working = std::move(intervals).value();
    }

    std::vector<data::TimeInterval> busyInRange;
    for (const data::TimeInterval &interval : busy) {
        if (const auto clipped = clipTo(interval, range)) {
            busyInRange.push_back(*clipped);
        }
    }
    busyInRange = mergeIntervals(std::move(busyInRange));

    std::vector<data::AvailabilityWindow> explicitInRange;
    for (const data::AvailabilityWindow &window : explicitWindows) {
        if (const auto clipped = clipTo(window.interval, range)) {
            explicitInRange.push_back(data::AvailabilityWindow{ *clipped, window.status });
        }
    }

    // Every status is constant between two consecutive boundaries.
    std::vector<QDateTime> boundaries{ range.start, range.end };
    const auto addBoundaries = [&boundaries](const data::TimeInterval &interval) {
        boundaries.push_back(interval.start);
        boundaries.push_back(interval.end);
    };
    std::for_each(working.begin(), working.end(), addBoundaries);
    std::for_each(busyInRange.begin(), busyInRange.end(), addBoundaries);
    for (const data::AvailabilityWindow &window : explicitInRange) {
        addBoundaries(window.interval);
    }
    std::sort(boundaries.begin(), boundaries.end());
    boundaries.erase(std::unique(boundaries.begin(), boundaries.end()), boundaries.end());

    std::stable_sort(explicitInRange.begin(), explicitInRange.end(),
                     [](const data::AvailabilityWindow &lhs, const data::AvailabilityWindow &rhs) {
                         return lhs.interval.start < rhs.interval.start;
                     });
    std::size_t nextExplicit = 0;
    std::vector<const data::AvailabilityWindow *> activeExplicit;
    IntervalWalker busyWalker(busyInRange);
    IntervalWalker workingWalker(working);

    std::vector<data::AvailabilityWindow> windows;
    for (std::size_t i = 0; i + 1 < boundaries.size(); ++i) {
        const data::TimeInterval segment{ boundaries[i], boundaries[i + 1] };

        while (nextExplicit < explicitInRange.size() && explicitInRange[nextExplicit].interval.start <= segment.start) {
            activeExplicit.push_back(&explicitInRange[nextExplicit]);
            ++nextExplicit;
        }
        activeExplicit.erase(std::remove_if(activeExplicit.begin(), activeExplicit.end(),
                                            [&segment](const data::AvailabilityWindow *window) {
                                                return window->interval.end <= segment.start;
                                            }),
                             activeExplicit.end());

        std::optional<data::AvailabilityStatus> status;
        for (const data::AvailabilityWindow *window : activeExplicit) {
            if (!status || restriction(window->status) > restriction(*status)) {
                status = window->status;
            }
        }
        const bool isBusy = busyWalker.contains(segment.start);
        const bool isWorking = workingWalker.contains(segment.start);
        if (!status && isBusy) {
            status = data::AvailabilityStatus::Busy;
        }
        if (!status && isWorking) {
            status = data::AvailabilityStatus::Free;
        }
        if (!status) {
            continue;
        }

        if (!windows.empty() && windows.back().status == *status && windows.back().interval.end == segment.start) {
            windows.back().interval.end = segment.end;
        } else {
            windows.push_back(data::AvailabilityWindow{ segment, *status });
        }
    }

    qCDebug(AGENDA_AVAILABILITY_LOG) << "Availability over" << range.start << range.end << "has" << windows.size()
                                     << "windows";
    return windows;
}

Result<std::vector<data::TimeInterval>> AvailabilityEngine::findFreeSlots(
    const std::vector<data::TimeInterval> &busy, const std::vector<data::WorkingHoursRule> &workingHours,
    const data::TimeInterval &range, qint64 durationSecs) const
{
    if (durationSecs <= 0) {
        return ScheduleError::invalidInterval(QStringLiteral("slot duration must be positive"));
    }
    auto windows = getAvailability(busy, {}, workingHours, range);
    if (!windows) {
        return windows.error();
    }

    std::vector<data::TimeInterval> slots;
    for (const data::AvailabilityWindow &window : windows.value()) {
        if (window.status == data::AvailabilityStatus::Free && window.interval.durationSecs() >= durationSecs) {
            slots.push_back(data::TimeInterval::fromStart(window.interval.start, durationSecs));
        }
    }
    return slots;
}

Result<data::Booking, BookingError> AvailabilityEngine::bookSlot(const data::TimeInterval &slot,
                                                                 const std::vector<data::TimeInterval> &busy,
                                                                 const QString &ownerId) const
{
    if (!slot.isValid()) {
        return BookingError::InvalidSlot;
    }
    const auto taken = std::find_if(busy.begin(), busy.end(), [&slot](const data::TimeInterval &interval) {
        return interval.overlaps(slot);
    });
    if (taken != busy.end()) {
        qCInfo(AGENDA_AVAILABILITY_LOG) << "Slot" << slot.start << slot.end << "for" << ownerId
                                        << "overlaps busy interval" << taken->start << taken->end;
        return BookingError::SlotNoLongerFree;
    }
    return data::Booking{ slot, ownerId, data::BookingStatus::Pending };
}

Result<data::Booking, BookingError> AvailabilityEngine::confirm(const data::Booking &booking)
{
    if (booking.status != data::BookingStatus::Pending) {
        return BookingError::InvalidTransition;
    }
    data::Booking confirmed = booking;
    confirmed.status = data::BookingStatus::Confirmed;
    return confirmed;
}

Result<data::Booking, BookingError> AvailabilityEngine::cancel(const data::Booking &booking)
{
    if (booking.status == data::BookingStatus::Cancelled) {
        return BookingError::InvalidTransition;
    }
    data::Booking cancelled = booking;
    cancelled.status = data::BookingStatus::Cancelled;
    return cancelled;
}

Result<std::vector<data::TimeInterval>> AvailabilityEngine::workingIntervals(
    const std::vector<data::WorkingHoursRule> &rules, const data::TimeInterval &range) const
{
    if (!range.isValid()) {
        return ScheduleError::invalidInterval(QStringLiteral("working-hours range must be non-empty"));
    }

    std::vector<data::TimeInterval> intervals;
    for (const data::WorkingHoursRule &rule : rules) {
        const auto zone = m_resolver.zone(rule.timezone);
        if (!zone) {
            qCWarning(AGENDA_AVAILABILITY_LOG) << "Working hours use unknown zone" << rule.timezone;
            return ScheduleError::invalidTimezone(rule.timezone);
        }
        if (!rule.dailyStart.isValid() || !rule.dailyEnd.isValid()) {
            return ScheduleError::invalidInterval(QStringLiteral("working hours need valid start and end times"));
        }

        // One day of margin on both sides catches shifts crossing midnight.
        const QDate first = TimezoneResolver::localIn(range.start, *zone).date.addDays(-1);
        const QDate last = TimezoneResolver::localIn(range.end, *zone).date.addDays(1);
        const bool overnight = rule.dailyEnd <= rule.dailyStart;
        for (QDate day = first; day <= last; day = day.addDays(1)) {
            if (rule.daysOfWeek.count(static_cast<Qt::DayOfWeek>(day.dayOfWeek())) == 0) {
                continue;
            }
            const data::LocalDateTime startLocal{ day, rule.dailyStart };
            const data::LocalDateTime endLocal{ overnight ? day.addDays(1) : day, rule.dailyEnd };
            const data::TimeInterval shift{ m_resolver.resolveIn(startLocal, *zone).instant,
                                            m_resolver.resolveIn(endLocal, *zone).instant };
            if (const auto clipped = clipTo(shift, range)) {
                intervals.push_back(*clipped);
            }
        }
    }
    return mergeIntervals(std::move(intervals));
}

std::vector<data::TimeInterval> AvailabilityEngine::mergeIntervals(std::vector<data::TimeInterval> intervals)
{
    intervals.erase(std::remove_if(intervals.begin(), intervals.end(),
                                   [](const data::TimeInterval &interval) { return !interval.isValid(); }),
                    intervals.end());
    std::sort(intervals.begin(), intervals.end(), [](const data::TimeInterval &lhs, const data::TimeInterval &rhs) {
        return lhs.start < rhs.start;
    });

    std::vector<data::TimeInterval> merged;
    for (const data::TimeInterval &interval : intervals) {
        if (!merged.empty() && interval.start <= merged.back().end) {
            merged.back().end = std::max(merged.back().end, interval.end);
        } else {
            merged.push_back(interval);
        }
    }
    return merged;
}

} // namespace core
} // namespace agenda
