#pragma once

#include <QHash>

#include "agenda/data/EventRepository.hpp"

namespace agenda {
namespace data {

class InMemoryEventRepository : public EventRepository
{
public:
    InMemoryEventRepository();
    ~InMemoryEventRepository() override;

    std::vector<EventRecord> fetchRecords(const QDateTime &from, const QDateTime &to) const override;
    std::optional<EventRecord> findById(const QString &id) const override;
    EventRecord addRecord(EventRecord record) override;
    bool updateRecord(const EventRecord &record) override;
    bool removeRecord(const QString &id) override;

private:
    QHash<QString, EventRecord> m_records;
};

} // namespace data
} // namespace agenda
