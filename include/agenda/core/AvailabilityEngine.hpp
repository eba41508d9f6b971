#pragma once

#include <QString>
#include <vector>

#include "agenda/core/Errors.hpp"
#include "agenda/core/Result.hpp"
#include "agenda/data/Availability.hpp"
#include "agenda/data/Booking.hpp"
#include "agenda/data/TimeInterval.hpp"

namespace agenda {
namespace core {

class TimezoneResolver;

// Where and when to look for free time.
struct SlotSearch
{
    data::TimeInterval range;
    std::vector<data::WorkingHoursRule> workingHours;
};

// Free/busy computation and slot booking over caller-supplied state.
//
// The engine keeps no busy set of its own. bookSlot() re-checks the slot
// against whatever busy intervals the caller passes at that moment;
// serializing concurrent bookers is up to the caller.
class AvailabilityEngine
{
public:
    explicit AvailabilityEngine(const TimezoneResolver &resolver);

    // Ordered, non-overlapping windows covering the reported parts of
    // `range`. Explicit windows win over busy/free inference; outside
    // working hours nothing is reported unless it is busy or explicit.
    Result<std::vector<data::AvailabilityWindow>> getAvailability(
        const std::vector<data::TimeInterval> &busy, const std::vector<data::AvailabilityWindow> &explicitWindows,
        const std::vector<data::WorkingHoursRule> &workingHours, const data::TimeInterval &range) const;

    // Earliest `durationSecs` of every free window that is long enough.
    Result<std::vector<data::TimeInterval>> findFreeSlots(const std::vector<data::TimeInterval> &busy,
                                                          const std::vector<data::WorkingHoursRule> &workingHours,
                                                          const data::TimeInterval &range,
                                                          qint64 durationSecs) const;

    Result<data::Booking, BookingError> bookSlot(const data::TimeInterval &slot,
                                                 const std::vector<data::TimeInterval> &busy,
                                                 const QString &ownerId) const;

    static Result<data::Booking, BookingError> confirm(const data::Booking &booking);
    static Result<data::Booking, BookingError> cancel(const data::Booking &booking);

    // Working-hours rules as instants, clipped to `range` and merged.
    Result<std::vector<data::TimeInterval>> workingIntervals(const std::vector<data::WorkingHoursRule> &rules,
                                                             const data::TimeInterval &range) const;

    static std::vector<data::TimeInterval> mergeIntervals(std::vector<data::TimeInterval> intervals);

private:
    const TimezoneResolver &m_resolver;
};

} // namespace core
} // namespace agenda
