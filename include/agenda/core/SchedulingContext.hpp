#pragma once

#include <memory>
#include <vector>

#include "agenda/core/EngineSettings.hpp"
#include "agenda/core/Result.hpp"
#include "agenda/data/Occurrence.hpp"
#include "agenda/data/TimeInterval.hpp"

namespace agenda {
namespace data {
class EventRepository;
}

namespace core {

class AvailabilityEngine;
class ConflictDetector;
class EventRecordAdapter;
class RecurrenceEngine;
class TimezoneDatabase;
class TimezoneResolver;

class SchedulingContext
{
public:
    explicit SchedulingContext(std::shared_ptr<const TimezoneDatabase> database,
                               EngineSettings settings = EngineSettings());
    ~SchedulingContext();

    const EngineSettings &settings() const;
    const TimezoneResolver &resolver() const;
    const RecurrenceEngine &recurrence() const;
    const ConflictDetector &conflicts() const;
    const AvailabilityEngine &availability() const;
    const EventRecordAdapter &records() const;

    // Every occurrence of the repository's events overlapping `range`,
    // ordered by start. The first bad record fails the whole call.
    Result<std::vector<data::Occurrence>> materialize(const data::EventRepository &repository,
                                                      const data::TimeInterval &range) const;

    static std::vector<data::TimeInterval> busyIntervals(const std::vector<data::Occurrence> &occurrences);

private:
    EngineSettings m_settings;
    std::unique_ptr<TimezoneResolver> m_resolver;
    std::unique_ptr<RecurrenceEngine> m_recurrence;
    std::unique_ptr<AvailabilityEngine> m_availability;
    std::unique_ptr<ConflictDetector> m_conflicts;
    std::unique_ptr<EventRecordAdapter> m_records;
};

} // namespace core
} // namespace agenda
