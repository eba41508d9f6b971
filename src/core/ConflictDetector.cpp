#include "agenda/core/ConflictDetector.hpp"

#include <algorithm>
#include <cstddef>
#include <utility>

#include "agenda/core/Logging.hpp"

namespace agenda {
namespace core {

namespace {
// Earlier creation wins; an unknown creation time loses to any known one.
bool createdEarlier(const QDateTime &lhs, const QDateTime &rhs)
{
    if (lhs.isValid() != rhs.isValid()) {
        return lhs.isValid();
    }
    return lhs.isValid() && lhs < rhs;
}

data::ConflictGroup buildGroup(const std::vector<data::Occurrence> &occurrences,
                               const std::vector<std::size_t> &members,
                               const std::optional<ConflictDetector::PriorityMap> &priorities)
{
    data::ConflictGroup group;
    group.kind = data::ConflictKind::Hard;
    group.span = occurrences[members.front()].interval;

    for (std::size_t i = 0; i < members.size(); ++i) {
        const data::Occurrence &first = occurrences[members[i]];
        group.members << first.id();
        group.span.end = std::max(group.span.end, first.interval.end);
        if (first.interval != occurrences[members.front()].interval) {
            group.kind = data::ConflictKind::Soft;
        }
        for (std::size_t j = i + 1; j < members.size(); ++j) {
            const data::Occurrence &second = occurrences[members[j]];
            if (ConflictDetector::hasConflict(first.interval, second.interval)) {
                group.pairs.push_back(data::ConflictPair{ first.id(), second.id(),
                                                          ConflictDetector::classify(first.interval, second.interval) });
            }
        }
    }

    if (priorities) {
        std::size_t best = members.front();
        for (std::size_t index : members) {
            const data::Occurrence &candidate = occurrences[index];
            const data::Occurrence &current = occurrences[best];
            const int candidatePriority = priorities->value(candidate.sourceEventId, 0);
            const int currentPriority = priorities->value(current.sourceEventId, 0);
            if (candidatePriority > currentPriority
                || (candidatePriority == currentPriority && createdEarlier(candidate.createdAt, current.createdAt))
                || (candidatePriority == currentPriority && candidate.createdAt == current.createdAt
                    && index < best)) {
                best = index;
            }
        }
        group.dominant = occurrences[best].id();
    }
    return group;
}
} // namespace

ConflictDetector::ConflictDetector(const AvailabilityEngine &availability)
    : m_availability(availability)
{
}

bool ConflictDetector::hasConflict(const data::TimeInterval &a, const data::TimeInterval &b)
{
    return a.overlaps(b);
}

data::ConflictKind ConflictDetector::classify(const data::TimeInterval &a, const data::TimeInterval &b)
{
    return a == b ? data::ConflictKind::Hard : data::ConflictKind::Soft;
}

std::vector<data::ConflictGroup> ConflictDetector::findConflicts(const std::vector<data::Occurrence> &occurrences,
                                                                 const std::optional<data::TimeInterval> &rangeFilter,
                                                                 const std::optional<PriorityMap> &priorities) const
{
    std::vector<std::size_t> order;
    for (std::size_t i = 0; i < occurrences.size(); ++i) {
        const data::TimeInterval &interval = occurrences[i].interval;
        if (!interval.isValid()) {
            qCWarning(AGENDA_CONFLICTS_LOG) << "Ignoring occurrence with empty interval" << occurrences[i].id();
            continue;
        }
        if (rangeFilter && !interval.overlaps(*rangeFilter)) {
            continue;
        }
        order.push_back(i);
    }
    std::stable_sort(order.begin(), order.end(), [&occurrences](std::size_t lhs, std::size_t rhs) {
        return occurrences[lhs].interval.start < occurrences[rhs].interval.start;
    });

    // Sweep by start: a member joins the running group while it starts
    // before the furthest end seen so far.
    std::vector<data::ConflictGroup> groups;
    std::vector<std::size_t> current;
    QDateTime currentEnd;
    const auto flush = [&]() {
        if (current.size() > 1) {
            groups.push_back(buildGroup(occurrences, current, priorities));
        }
        current.clear();
    };
    for (std::size_t index : order) {
        const data::TimeInterval &interval = occurrences[index].interval;
        if (!current.empty() && interval.start < currentEnd) {
            current.push_back(index);
            currentEnd = std::max(currentEnd, interval.end);
            continue;
        }
        flush();
        current.push_back(index);
        currentEnd = interval.end;
    }
    flush();

    qCDebug(AGENDA_CONFLICTS_LOG) << "Found" << groups.size() << "conflict groups among" << order.size()
                                  << "occurrences";
    return groups;
}

Result<std::vector<data::TimeInterval>> ConflictDetector::suggestAlternatives(
    const QString &eventId, const std::vector<data::Occurrence> &occurrences, const SlotSearch &query) const
{
    std::optional<data::Occurrence> target;
    std::optional<data::Occurrence> firstOwn;
    for (const data::Occurrence &occurrence : occurrences) {
        if (occurrence.sourceEventId != eventId || !occurrence.interval.isValid()) {
            continue;
        }
        if (!firstOwn || occurrence.interval.start < firstOwn->interval.start) {
            firstOwn = occurrence;
        }
        const bool conflicting =
            std::any_of(occurrences.begin(), occurrences.end(), [&occurrence](const data::Occurrence &other) {
                return other.sourceEventId != occurrence.sourceEventId
                    && hasConflict(other.interval, occurrence.interval);
            });
        if (conflicting && (!target || occurrence.interval.start < target->interval.start)) {
            target = occurrence;
        }
    }
    if (!target) {
        target = firstOwn;
    }
    if (!target) {
        qCDebug(AGENDA_CONFLICTS_LOG) << "No occurrence of" << eventId << "to find alternatives for";
        return std::vector<data::TimeInterval>{};
    }

    std::vector<data::TimeInterval> busy;
    busy.reserve(occurrences.size());
    for (const data::Occurrence &occurrence : occurrences) {
        busy.push_back(occurrence.interval);
    }

    auto slots = m_availability.findFreeSlots(busy, query.workingHours, query.range,
                                              target->interval.durationSecs());
    if (!slots) {
        return slots.error();
    }

    std::vector<data::TimeInterval> candidates = std::move(slots).value();
    const QDateTime original = target->interval.start;
    std::sort(candidates.begin(), candidates.end(),
              [&original](const data::TimeInterval &lhs, const data::TimeInterval &rhs) {
                  const qint64 lhsDistance = qAbs(original.secsTo(lhs.start));
                  const qint64 rhsDistance = qAbs(original.secsTo(rhs.start));
                  if (lhsDistance != rhsDistance) {
                      return lhsDistance < rhsDistance;
                  }
                  return lhs.start < rhs.start;
              });
    return candidates;
}

} // namespace core
} // namespace agenda
