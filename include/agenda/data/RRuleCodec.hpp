#pragma once

#include <QString>
#include <optional>

#include "agenda/core/Result.hpp"
#include "agenda/data/RecurrenceRule.hpp"

namespace agenda {
namespace data {

// RFC 5545 RRULE value <-> RecurrenceRule.
//
// parse() is purely syntactic; RecurrenceEngine::validate() checks the
// semantic constraints. format() gives back the parsed text byte for byte
// as long as the rule was not changed since parsing.
class RRuleCodec
{
public:
    static core::Result<RecurrenceRule, core::RuleError> parse(const QString &text);
    static QString format(const RecurrenceRule &rule);

    static QString weekdayToString(Qt::DayOfWeek day);
    static std::optional<Qt::DayOfWeek> weekdayFromString(const QString &value);

private:
    static QString formatCanonical(const RecurrenceRule &rule);
    static QString formatUntil(const RecurrenceUntil &until);
    static std::optional<RecurrenceUntil> parseUntil(const QString &value);
    static std::optional<WeekdayNum> parseWeekdayNum(const QString &value);
    static std::optional<int> parseSignedInt(const QString &value);
};

} // namespace data
} // namespace agenda
