#pragma once

#include <QString>
#include <QTime>
#include <set>

#include "agenda/data/TimeInterval.hpp"

namespace agenda {
namespace data {

enum class AvailabilityStatus
{
    Free,
    Busy,
    Tentative,
    OutOfOffice,
};

struct AvailabilityWindow
{
    TimeInterval interval;
    AvailabilityStatus status = AvailabilityStatus::Free;
};

inline bool operator==(const AvailabilityWindow &lhs, const AvailabilityWindow &rhs)
{
    return lhs.interval == rhs.interval && lhs.status == rhs.status;
}

// dailyEnd <= dailyStart means the shift ends on the following day.
struct WorkingHoursRule
{
    QTime dailyStart;
    QTime dailyEnd;
    std::set<Qt::DayOfWeek> daysOfWeek;
    QString timezone;
};

} // namespace data
} // namespace agenda
