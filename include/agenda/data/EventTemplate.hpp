#pragma once

#include <QDate>
#include <QDateTime>
#include <QString>
#include <optional>
#include <vector>

#include "agenda/data/LocalDateTime.hpp"
#include "agenda/data/RecurrenceRule.hpp"

namespace agenda {
namespace data {

// Moves the instance generated for originalDate (RECURRENCE-ID).
struct OccurrenceOverride
{
    QDate originalDate;
    LocalDateTime startLocal;
    LocalDateTime endLocal;
};

struct EventTemplate
{
    QString id;
    LocalDateTime startLocal;
    LocalDateTime endLocal;
    QString timezone;
    std::optional<RecurrenceRule> recurrence;
    std::vector<OccurrenceOverride> overrides;
    QDateTime createdAt;

    qint64 durationSecs() const { return startLocal.secsTo(endLocal); }
    bool isRecurring() const { return recurrence.has_value(); }
};

} // namespace data
} // namespace agenda
