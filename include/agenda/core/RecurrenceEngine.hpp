#pragma once

#include <QDateTime>
#include <QTimeZone>
#include <optional>
#include <vector>

#include "agenda/core/Errors.hpp"
#include "agenda/core/OccurrenceCursor.hpp"
#include "agenda/core/Result.hpp"
#include "agenda/data/EventTemplate.hpp"
#include "agenda/data/Occurrence.hpp"
#include "agenda/data/RecurrenceRule.hpp"

namespace agenda {
namespace core {

class TimezoneResolver;

// Turns event templates into timezone-resolved occurrences.
//
// Range arguments are half-open [rangeStart, rangeEnd); an invalid
// QDateTime leaves that side open. Without rangeEnd, UNTIL or COUNT an
// expansion would never end and is refused with UnboundedExpansion.
class RecurrenceEngine
{
public:
    explicit RecurrenceEngine(const TimezoneResolver &resolver, int maxPeriods = 50000);

    static std::optional<RuleError> validate(const data::RecurrenceRule &rule);

    Result<OccurrenceCursor> cursor(const data::EventTemplate &event, const QDateTime &rangeStart,
                                    const QDateTime &rangeEnd, ClipMode clip = ClipMode::Overlap) const;

    // Occurrences overlapping the range, ordered by start.
    Result<std::vector<data::Occurrence>> expand(const data::EventTemplate &event, const QDateTime &rangeStart,
                                                 const QDateTime &rangeEnd) const;

    // Occurrences starting inside the range, ordered by start. Consecutive
    // windows never return the same occurrence twice.
    Result<std::vector<data::Occurrence>> occurrencesBetween(const data::EventTemplate &event,
                                                             const QDateTime &rangeStart,
                                                             const QDateTime &rangeEnd) const;

    // First occurrence starting strictly after `after`.
    Result<std::optional<data::Occurrence>> nextOccurrence(const data::EventTemplate &event,
                                                           const QDateTime &after) const;

private:
    Result<QTimeZone> prepare(const data::EventTemplate &event) const;
    Result<std::vector<data::Occurrence>> collect(const data::EventTemplate &event, const QDateTime &rangeStart,
                                                  const QDateTime &rangeEnd, ClipMode clip) const;

    const TimezoneResolver &m_resolver;
    int m_maxPeriods;
};

} // namespace core
} // namespace agenda
