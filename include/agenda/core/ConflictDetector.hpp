#pragma once

#include <QHash>
#include <QString>
#include <optional>
#include <vector>

#include "agenda/core/AvailabilityEngine.hpp"
#include "agenda/core/Result.hpp"
#include "agenda/data/ConflictGroup.hpp"
#include "agenda/data/Occurrence.hpp"
#include "agenda/data/TimeInterval.hpp"

namespace agenda {
namespace core {

// Groups overlapping occurrences and proposes free alternatives.
class ConflictDetector
{
public:
    // Event id to priority; higher wins, absent ids count as 0.
    using PriorityMap = QHash<QString, int>;

    explicit ConflictDetector(const AvailabilityEngine &availability);

    static bool hasConflict(const data::TimeInterval &a, const data::TimeInterval &b);
    static data::ConflictKind classify(const data::TimeInterval &a, const data::TimeInterval &b);

    // Connected components of the overlap relation with two or more members,
    // ordered by earliest start, then input order.
    std::vector<data::ConflictGroup> findConflicts(const std::vector<data::Occurrence> &occurrences,
                                                   const std::optional<data::TimeInterval> &rangeFilter = std::nullopt,
                                                   const std::optional<PriorityMap> &priorities = std::nullopt) const;

    // Free slots of the conflicting occurrence's length, closest to its
    // original start first. Empty when `eventId` has no occurrence.
    Result<std::vector<data::TimeInterval>> suggestAlternatives(const QString &eventId,
                                                                const std::vector<data::Occurrence> &occurrences,
                                                                const SlotSearch &query) const;

private:
    const AvailabilityEngine &m_availability;
};

} // namespace core
} // namespace agenda
