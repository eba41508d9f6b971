#pragma once

#include <QString>

#include "agenda/data/TimeInterval.hpp"

namespace agenda {
namespace data {

enum class BookingStatus
{
    Pending,
    Confirmed,
    Cancelled,
};

struct Booking
{
    TimeInterval interval;
    QString ownerId;
    BookingStatus status = BookingStatus::Pending;
};

} // namespace data
} // namespace agenda
