#pragma once

#include <QString>
#include <QStringList>

namespace agenda {
namespace data {

// Plain event record as handed over by the external object store.
struct EventRecord
{
    QString id;
    QString startTime; // ISO 8601, floating wall clock or with Z / offset
    QString endTime;
    QString timezone;  // IANA identifier
    QString rrule;     // RFC 5545 RRULE value, empty for single events
    QStringList exdates;
    QString createdAt;
};

} // namespace data
} // namespace agenda
