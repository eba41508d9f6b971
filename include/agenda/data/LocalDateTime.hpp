#pragma once

#include <QDate>
#include <QDateTime>
#include <QString>
#include <QTime>

namespace agenda {
namespace data {

// Calendar date and time of day without a zone. Only meaningful once
// resolved against an IANA zone.
struct LocalDateTime
{
    QDate date;
    QTime time;

    bool isValid() const { return date.isValid() && time.isValid(); }

    // Same fields placed on the UTC axis, used for wall-clock arithmetic.
    QDateTime asUtcAxis() const { return QDateTime(date, time, Qt::UTC); }

    static LocalDateTime fromUtcAxis(const QDateTime &value)
    {
        const QDateTime utc = value.toUTC();
        return LocalDateTime{ utc.date(), utc.time() };
    }

    qint64 secsTo(const LocalDateTime &other) const { return asUtcAxis().secsTo(other.asUtcAxis()); }
    LocalDateTime addSecs(qint64 secs) const { return fromUtcAxis(asUtcAxis().addSecs(secs)); }

    QString toString() const { return asUtcAxis().toString(QStringLiteral("yyyy-MM-dd'T'hh:mm:ss")); }
};

inline bool operator==(const LocalDateTime &lhs, const LocalDateTime &rhs)
{
    return lhs.date == rhs.date && lhs.time == rhs.time;
}

inline bool operator!=(const LocalDateTime &lhs, const LocalDateTime &rhs)
{
    return !(lhs == rhs);
}

inline bool operator<(const LocalDateTime &lhs, const LocalDateTime &rhs)
{
    if (lhs.date == rhs.date) {
        return lhs.time < rhs.time;
    }
    return lhs.date < rhs.date;
}

inline bool operator<=(const LocalDateTime &lhs, const LocalDateTime &rhs)
{
    return !(rhs < lhs);
}

} // namespace data
} // namespace agenda
