#pragma once

#include <QString>

#include "agenda/core/Result.hpp"
#include "agenda/data/EventRecord.hpp"
#include "agenda/data/EventTemplate.hpp"

namespace agenda {
namespace core {

class TimezoneResolver;

// Converts store records into validated templates and back.
class EventRecordAdapter
{
public:
    explicit EventRecordAdapter(const TimezoneResolver &resolver);

    Result<data::EventTemplate> toTemplate(const data::EventRecord &record) const;
    data::EventRecord toRecord(const data::EventTemplate &event) const;

private:
    const TimezoneResolver &m_resolver;
};

} // namespace core
} // namespace agenda
