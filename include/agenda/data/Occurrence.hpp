#pragma once

#include <QDate>
#include <QDateTime>
#include <QString>

#include "agenda/data/TimeInterval.hpp"

namespace agenda {
namespace data {

struct Occurrence
{
    QString sourceEventId;
    TimeInterval interval;
    bool isException = false;
    QDate recurrenceDate; // local date the series generated this instance for
    QDateTime createdAt;

    // An overridden instance may land on another instance's start, so it
    // also carries the date it was generated for.
    QString id() const
    {
        QString result = sourceEventId + QLatin1Char('@')
            + interval.start.toUTC().toString(QStringLiteral("yyyyMMdd'T'hhmmss'Z'"));
        if (isException && recurrenceDate.isValid()) {
            result += QLatin1Char('/') + recurrenceDate.toString(QStringLiteral("yyyyMMdd"));
        }
        return result;
    }
};

} // namespace data
} // namespace agenda
