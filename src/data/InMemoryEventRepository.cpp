#include "agenda/data/InMemoryEventRepository.hpp"

#include <QDate>
#include <QUuid>
#include <algorithm>

namespace agenda {
namespace data {

namespace {
// Leading calendar date of an ISO 8601 or iCalendar timestamp.
QDate leadingDate(const QString &value)
{
    QDate date = QDate::fromString(value.left(10), Qt::ISODate);
    if (!date.isValid()) {
        date = QDate::fromString(value.left(8), QStringLiteral("yyyyMMdd"));
    }
    return date;
}
} // namespace

InMemoryEventRepository::InMemoryEventRepository() = default;
InMemoryEventRepository::~InMemoryEventRepository() = default;

std::vector<EventRecord> InMemoryEventRepository::fetchRecords(const QDateTime &from, const QDateTime &to) const
{
    // Day granularity with one day of slack on each side: record times are
    // wall clock in their own zone, which can be up to a day off UTC.
    const QDate fromDate = from.isValid() ? from.toUTC().date().addDays(-1) : QDate();
    const QDate toDate = to.isValid() ? to.toUTC().date().addDays(1) : QDate();

    std::vector<EventRecord> records;
    for (const auto &record : m_records) {
        if (record.rrule.isEmpty()) {
            const QDate start = leadingDate(record.startTime);
            const QDate end = leadingDate(record.endTime);
            if (fromDate.isValid() && end.isValid() && end < fromDate) {
                continue;
            }
            if (toDate.isValid() && start.isValid() && start > toDate) {
                continue;
            }
        }
        records.push_back(record);
    }
    std::sort(records.begin(), records.end(), [](const EventRecord &lhs, const EventRecord &rhs) {
        if (lhs.startTime == rhs.startTime) {
            return lhs.id < rhs.id;
        }
        return lhs.startTime < rhs.startTime;
    });
    return records;
}

std::optional<EventRecord> InMemoryEventRepository::findById(const QString &id) const
{
    if (m_records.contains(id)) {
        return m_records.value(id);
    }
    return std::nullopt;
}

EventRecord InMemoryEventRepository::addRecord(EventRecord record)
{
    if (record.id.isEmpty()) {
        record.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    }
    m_records.insert(record.id, record);
    return record;
}

bool InMemoryEventRepository::updateRecord(const EventRecord &record)
{
    if (!m_records.contains(record.id)) {
        return false;
    }
    m_records.insert(record.id, record);
    return true;
}

bool InMemoryEventRepository::removeRecord(const QString &id)
{
    return m_records.remove(id) > 0;
}

} // namespace data
} // namespace agenda
