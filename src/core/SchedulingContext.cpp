#include "agenda/core/SchedulingContext.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

#include "agenda/data/EventRepository.hpp"

#include "agenda/core/AvailabilityEngine.hpp"
#include "agenda/core/ConflictDetector.hpp"
#include "agenda/core/EventRecordAdapter.hpp"
#include "agenda/core/Logging.hpp"
#include "agenda/core/RecurrenceEngine.hpp"
#include "agenda/core/TimezoneResolver.hpp"

namespace agenda {
namespace core {

SchedulingContext::SchedulingContext(std::shared_ptr<const TimezoneDatabase> database, EngineSettings settings)
    : m_settings(std::move(settings))
    , m_resolver(std::make_unique<TimezoneResolver>(std::move(database), m_settings.ambiguity))
    , m_recurrence(std::make_unique<RecurrenceEngine>(*m_resolver, m_settings.maxPeriods))
    , m_availability(std::make_unique<AvailabilityEngine>(*m_resolver))
    , m_conflicts(std::make_unique<ConflictDetector>(*m_availability))
    , m_records(std::make_unique<EventRecordAdapter>(*m_resolver))
{
}

SchedulingContext::~SchedulingContext() = default;

const EngineSettings &SchedulingContext::settings() const
{
    return m_settings;
}

const TimezoneResolver &SchedulingContext::resolver() const
{
    return *m_resolver;
}

const RecurrenceEngine &SchedulingContext::recurrence() const
{
    return *m_recurrence;
}

const ConflictDetector &SchedulingContext::conflicts() const
{
    return *m_conflicts;
}

const AvailabilityEngine &SchedulingContext::availability() const
{
    return *m_availability;
}

const EventRecordAdapter &SchedulingContext::records() const
{
    return *m_records;
}

Result<std::vector<data::Occurrence>> SchedulingContext::materialize(const data::EventRepository &repository,
                                                                     const data::TimeInterval &range) const
{
    if (!range.isValid()) {
        return ScheduleError::invalidInterval(QStringLiteral("materialize range must be non-empty"));
    }

    std::vector<data::Occurrence> occurrences;
    const auto records = repository.fetchRecords(range.start, range.end);
    for (const data::EventRecord &record : records) {
        auto event = m_records->toTemplate(record);
        if (!event) {
            ScheduleError error = event.error();
            error.detail = QStringLiteral("record '%1': %2").arg(record.id, error.detail);
            return error;
        }
        auto expanded = m_recurrence->expand(event.value(), range.start, range.end);
        if (!expanded) {
            return expanded.error();
        }
        std::vector<data::Occurrence> &batch = expanded.value();
        std::move(batch.begin(), batch.end(), std::back_inserter(occurrences));
    }

    std::stable_sort(occurrences.begin(), occurrences.end(), [](const data::Occurrence &lhs, const data::Occurrence &rhs) {
        return lhs.interval.start < rhs.interval.start;
    });
    qCDebug(AGENDA_DATA_LOG) << "Materialized" << occurrences.size() << "occurrences from" << records.size()
                             << "records";
    return occurrences;
}

std::vector<data::TimeInterval> SchedulingContext::busyIntervals(const std::vector<data::Occurrence> &occurrences)
{
    std::vector<data::TimeInterval> busy;
    busy.reserve(occurrences.size());
    for (const data::Occurrence &occurrence : occurrences) {
        busy.push_back(occurrence.interval);
    }
    return AvailabilityEngine::mergeIntervals(std::move(busy));
}

} // namespace core
} // namespace agenda
