#pragma once

#include <QDateTime>
#include <QString>
#include <optional>
#include <vector>

#include "agenda/data/EventRecord.hpp"

namespace agenda {
namespace data {

// Interface of the external object store as seen by the scheduling core.
class EventRepository
{
public:
    virtual ~EventRepository() = default;

    // Single events touching [from, to] plus every recurring record; the
    // store cannot expand rules, so recurring records are never filtered.
    virtual std::vector<EventRecord> fetchRecords(const QDateTime &from, const QDateTime &to) const = 0;
    virtual std::optional<EventRecord> findById(const QString &id) const = 0;
    virtual EventRecord addRecord(EventRecord record) = 0;
    virtual bool updateRecord(const EventRecord &record) = 0;
    virtual bool removeRecord(const QString &id) = 0;
};

} // namespace data
} // namespace agenda
