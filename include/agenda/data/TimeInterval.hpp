#pragma once

#include <QDateTime>

namespace agenda {
namespace data {

// Half-open span [start, end) of absolute instants.
struct TimeInterval
{
    QDateTime start;
    QDateTime end;

    bool isValid() const { return start.isValid() && end.isValid() && start < end; }
    qint64 durationSecs() const { return start.secsTo(end); }

    bool overlaps(const TimeInterval &other) const { return start < other.end && other.start < end; }
    bool contains(const QDateTime &instant) const { return start <= instant && instant < end; }

    static TimeInterval fromStart(const QDateTime &start, qint64 durationSecs)
    {
        return TimeInterval{ start, start.addSecs(durationSecs) };
    }
};

inline bool operator==(const TimeInterval &lhs, const TimeInterval &rhs)
{
    return lhs.start == rhs.start && lhs.end == rhs.end;
}

inline bool operator!=(const TimeInterval &lhs, const TimeInterval &rhs)
{
    return !(lhs == rhs);
}

} // namespace data
} // namespace agenda
