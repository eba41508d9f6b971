#include "agenda/core/Errors.hpp"

#include <utility>

namespace agenda {
namespace core {

ScheduleError ScheduleError::fromRule(RuleError rule, QString detail)
{
    return ScheduleError{ ErrorCode::Rule, rule, std::move(detail) };
}

ScheduleError ScheduleError::invalidTimezone(const QString &zoneId)
{
    return ScheduleError{ ErrorCode::InvalidTimezone, RuleError::MalformedRule,
                          QStringLiteral("unknown IANA zone '%1'").arg(zoneId) };
}

ScheduleError ScheduleError::invalidTemplate(QString detail)
{
    return ScheduleError{ ErrorCode::InvalidTemplate, RuleError::MalformedRule, std::move(detail) };
}

ScheduleError ScheduleError::invalidInterval(QString detail)
{
    return ScheduleError{ ErrorCode::InvalidInterval, RuleError::MalformedRule, std::move(detail) };
}

ScheduleError ScheduleError::unboundedExpansion(QString detail)
{
    return ScheduleError{ ErrorCode::UnboundedExpansion, RuleError::MalformedRule, std::move(detail) };
}

QString ScheduleError::toString() const
{
    QString text = core::toString(code);
    if (code == ErrorCode::Rule) {
        text += QLatin1Char('/') + core::toString(rule);
    }
    if (!detail.isEmpty()) {
        text += QStringLiteral(": ") + detail;
    }
    return text;
}

QString toString(RuleError error)
{
    switch (error) {
    case RuleError::ConflictingTerminators:
        return QStringLiteral("ConflictingTerminators");
    case RuleError::InvalidInterval:
        return QStringLiteral("InvalidInterval");
    case RuleError::EmptyByWeekday:
        return QStringLiteral("EmptyByWeekday");
    case RuleError::InvalidMonthDay:
        return QStringLiteral("InvalidMonthDay");
    case RuleError::InvalidCount:
        return QStringLiteral("InvalidCount");
    case RuleError::InvalidOrdinal:
        return QStringLiteral("InvalidOrdinal");
    case RuleError::InvalidMonth:
        return QStringLiteral("InvalidMonth");
    case RuleError::MalformedRule:
    default:
        return QStringLiteral("MalformedRule");
    }
}

QString toString(BookingError error)
{
    switch (error) {
    case BookingError::SlotNoLongerFree:
        return QStringLiteral("SlotNoLongerFree");
    case BookingError::InvalidSlot:
        return QStringLiteral("InvalidSlot");
    case BookingError::InvalidTransition:
    default:
        return QStringLiteral("InvalidTransition");
    }
}

QString toString(ErrorCode code)
{
    switch (code) {
    case ErrorCode::Rule:
        return QStringLiteral("RuleError");
    case ErrorCode::InvalidTimezone:
        return QStringLiteral("InvalidTimezone");
    case ErrorCode::InvalidTemplate:
        return QStringLiteral("InvalidTemplate");
    case ErrorCode::InvalidInterval:
        return QStringLiteral("InvalidInterval");
    case ErrorCode::UnboundedExpansion:
    default:
        return QStringLiteral("UnboundedExpansion");
    }
}

} // namespace core
} // namespace agenda
