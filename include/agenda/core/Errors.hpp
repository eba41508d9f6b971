#pragma once

#include <QString>

namespace agenda {
namespace core {

enum class RuleError
{
    ConflictingTerminators, // both UNTIL and COUNT
    InvalidInterval,
    EmptyByWeekday,
    InvalidMonthDay,
    InvalidCount,
    InvalidOrdinal,
    InvalidMonth,
    MalformedRule, // text does not parse
};

enum class BookingError
{
    SlotNoLongerFree,
    InvalidSlot,
    InvalidTransition,
};

enum class ErrorCode
{
    Rule,
    InvalidTimezone,
    InvalidTemplate,
    InvalidInterval,
    UnboundedExpansion,
};

struct ScheduleError
{
    ErrorCode code = ErrorCode::InvalidTemplate;
    RuleError rule = RuleError::MalformedRule; // meaningful for ErrorCode::Rule only
    QString detail;

    static ScheduleError fromRule(RuleError rule, QString detail = QString());
    static ScheduleError invalidTimezone(const QString &zoneId);
    static ScheduleError invalidTemplate(QString detail);
    static ScheduleError invalidInterval(QString detail);
    static ScheduleError unboundedExpansion(QString detail);

    QString toString() const;
};

QString toString(RuleError error);
QString toString(BookingError error);
QString toString(ErrorCode code);

} // namespace core
} // namespace agenda
