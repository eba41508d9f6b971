#pragma once

#include <QDate>
#include <QDateTime>
#include <QString>
#include <QTime>
#include <optional>
#include <set>
#include <utility>
#include <vector>

namespace agenda {
namespace data {

enum class Frequency
{
    Daily,
    Weekly,
    Monthly,
    Yearly,
};

// BYDAY entry: "MO", "2TU", "-1FR".
struct WeekdayNum
{
    Qt::DayOfWeek weekday = Qt::Monday;
    int ordinal = 0; // 0 = every such weekday of the period
};

inline bool operator==(const WeekdayNum &lhs, const WeekdayNum &rhs)
{
    return lhs.weekday == rhs.weekday && lhs.ordinal == rhs.ordinal;
}

enum class UntilForm
{
    Date,             // 20260301
    FloatingDateTime, // 20260301T090000
    UtcDateTime,      // 20260301T090000Z
};

struct RecurrenceUntil
{
    UntilForm form = UntilForm::Date;
    QDate date;
    QTime time; // unused for UntilForm::Date; UTC fields for UntilForm::UtcDateTime

    QDateTime instant() const { return QDateTime(date, time, Qt::UTC); }
};

inline bool operator==(const RecurrenceUntil &lhs, const RecurrenceUntil &rhs)
{
    return lhs.form == rhs.form && lhs.date == rhs.date
        && (lhs.form == UntilForm::Date || lhs.time == rhs.time);
}

struct RecurrenceRule
{
    Frequency frequency = Frequency::Daily;
    int interval = 1;
    std::optional<std::vector<WeekdayNum>> byWeekday;
    std::optional<std::vector<int>> byMonthDay;
    std::optional<std::vector<int>> byMonth;
    Qt::DayOfWeek weekStart = Qt::Monday;
    std::optional<RecurrenceUntil> until;
    std::optional<int> count;
    std::set<QDate> exceptions; // EXDATE, not part of the RRULE text
    std::vector<std::pair<QString, QString>> extensions; // X-NAME=value, kept in order
    QString sourceText;
};

// Semantic equality; sourceText is ignored.
inline bool operator==(const RecurrenceRule &lhs, const RecurrenceRule &rhs)
{
    return lhs.frequency == rhs.frequency
        && lhs.interval == rhs.interval
        && lhs.byWeekday == rhs.byWeekday
        && lhs.byMonthDay == rhs.byMonthDay
        && lhs.byMonth == rhs.byMonth
        && lhs.weekStart == rhs.weekStart
        && lhs.until == rhs.until
        && lhs.count == rhs.count
        && lhs.exceptions == rhs.exceptions
        && lhs.extensions == rhs.extensions;
}

inline bool operator!=(const RecurrenceRule &lhs, const RecurrenceRule &rhs)
{
    return !(lhs == rhs);
}

} // namespace data
} // namespace agenda
