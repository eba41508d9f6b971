#include "agenda/data/RRuleCodec.hpp"

#include <QSet>
#include <QStringList>
#include <utility>

#include "agenda/core/Logging.hpp"

namespace agenda {
namespace data {

namespace {
constexpr auto DATE_FORMAT = "yyyyMMdd";
constexpr auto FLOATING_FORMAT = "yyyyMMdd'T'hhmmss";
constexpr auto UTC_FORMAT = "yyyyMMdd'T'hhmmss'Z'";

QString frequencyToString(Frequency frequency)
{
    switch (frequency) {
    case Frequency::Weekly:
        return QStringLiteral("WEEKLY");
    case Frequency::Monthly:
        return QStringLiteral("MONTHLY");
    case Frequency::Yearly:
        return QStringLiteral("YEARLY");
    case Frequency::Daily:
    default:
        return QStringLiteral("DAILY");
    }
}

std::optional<Frequency> frequencyFromString(const QString &value)
{
    if (value == QLatin1String("DAILY")) {
        return Frequency::Daily;
    }
    if (value == QLatin1String("WEEKLY")) {
        return Frequency::Weekly;
    }
    if (value == QLatin1String("MONTHLY")) {
        return Frequency::Monthly;
    }
    if (value == QLatin1String("YEARLY")) {
        return Frequency::Yearly;
    }
    return std::nullopt;
}

QString joinInts(const std::vector<int> &values)
{
    QStringList parts;
    for (int value : values) {
        parts << QString::number(value);
    }
    return parts.join(QLatin1Char(','));
}

core::Result<RecurrenceRule, core::RuleError> malformed(const QString &text, const QString &reason)
{
    qCDebug(AGENDA_DATA_LOG) << "Rejecting RRULE" << text << "-" << reason;
    return core::RuleError::MalformedRule;
}
} // namespace

core::Result<RecurrenceRule, core::RuleError> RRuleCodec::parse(const QString &text)
{
    QString body = text;
    if (body.startsWith(QLatin1String("RRULE:"), Qt::CaseInsensitive)) {
        body = body.mid(6);
    }
    if (body.isEmpty()) {
        return malformed(text, QStringLiteral("empty rule"));
    }

    RecurrenceRule rule;
    rule.sourceText = text;
    bool hasFrequency = false;
    QSet<QString> seen;

    const QStringList parts = body.split(QLatin1Char(';'));
    for (const QString &part : parts) {
        const int equals = part.indexOf(QLatin1Char('='));
        if (equals <= 0) {
            return malformed(text, QStringLiteral("part without name=value: '%1'").arg(part));
        }
        const QString name = part.left(equals).toUpper();
        const QString value = part.mid(equals + 1);
        if (seen.contains(name)) {
            return malformed(text, QStringLiteral("duplicate %1").arg(name));
        }
        seen.insert(name);

        if (name == QLatin1String("FREQ")) {
            const auto frequency = frequencyFromString(value.toUpper());
            if (!frequency) {
                return malformed(text, QStringLiteral("unsupported frequency '%1'").arg(value));
            }
            rule.frequency = *frequency;
            hasFrequency = true;
        } else if (name == QLatin1String("INTERVAL")) {
            const auto interval = parseSignedInt(value);
            if (!interval) {
                return malformed(text, QStringLiteral("bad INTERVAL"));
            }
            rule.interval = *interval;
        } else if (name == QLatin1String("COUNT")) {
            const auto count = parseSignedInt(value);
            if (!count) {
                return malformed(text, QStringLiteral("bad COUNT"));
            }
            rule.count = *count;
        } else if (name == QLatin1String("UNTIL")) {
            const auto until = parseUntil(value);
            if (!until) {
                return malformed(text, QStringLiteral("bad UNTIL"));
            }
            rule.until = *until;
        } else if (name == QLatin1String("BYDAY")) {
            std::vector<WeekdayNum> days;
            const QStringList entries = value.split(QLatin1Char(','), Qt::SkipEmptyParts);
            for (const QString &entry : entries) {
                const auto day = parseWeekdayNum(entry);
                if (!day) {
                    return malformed(text, QStringLiteral("bad BYDAY entry '%1'").arg(entry));
                }
                // "0MO" would read as every Monday; an explicit ordinal is never 0.
                if (day->ordinal == 0 && entry.size() > 2) {
                    qCDebug(AGENDA_DATA_LOG) << "Rejecting RRULE" << text << "- zero BYDAY ordinal";
                    return core::RuleError::InvalidOrdinal;
                }
                days.push_back(*day);
            }
            rule.byWeekday = days;
        } else if (name == QLatin1String("BYMONTHDAY") || name == QLatin1String("BYMONTH")) {
            std::vector<int> numbers;
            const QStringList entries = value.split(QLatin1Char(','), Qt::SkipEmptyParts);
            for (const QString &entry : entries) {
                const auto number = parseSignedInt(entry);
                if (!number) {
                    return malformed(text, QStringLiteral("bad %1 entry '%2'").arg(name, entry));
                }
                numbers.push_back(*number);
            }
            if (name == QLatin1String("BYMONTH")) {
                rule.byMonth = numbers;
            } else {
                rule.byMonthDay = numbers;
            }
        } else if (name == QLatin1String("WKST")) {
            const auto day = weekdayFromString(value);
            if (!day) {
                return malformed(text, QStringLiteral("bad WKST"));
            }
            rule.weekStart = *day;
        } else if (name.startsWith(QLatin1String("X-"))) {
            rule.extensions.emplace_back(part.left(equals), value);
        } else {
            return malformed(text, QStringLiteral("unsupported part %1").arg(name));
        }
    }

    if (!hasFrequency) {
        return malformed(text, QStringLiteral("missing FREQ"));
    }
    return rule;
}

QString RRuleCodec::format(const RecurrenceRule &rule)
{
    if (!rule.sourceText.isEmpty()) {
        auto reparsed = parse(rule.sourceText);
        if (reparsed) {
            RecurrenceRule original = std::move(reparsed).value();
            original.exceptions = rule.exceptions;
            if (original == rule) {
                return rule.sourceText;
            }
        }
    }
    return formatCanonical(rule);
}

QString RRuleCodec::weekdayToString(Qt::DayOfWeek day)
{
    switch (day) {
    case Qt::Monday:
        return QStringLiteral("MO");
    case Qt::Tuesday:
        return QStringLiteral("TU");
    case Qt::Wednesday:
        return QStringLiteral("WE");
    case Qt::Thursday:
        return QStringLiteral("TH");
    case Qt::Friday:
        return QStringLiteral("FR");
    case Qt::Saturday:
        return QStringLiteral("SA");
    case Qt::Sunday:
    default:
        return QStringLiteral("SU");
    }
}

std::optional<Qt::DayOfWeek> RRuleCodec::weekdayFromString(const QString &value)
{
    const QString normalized = value.toUpper();
    for (int day = Qt::Monday; day <= Qt::Sunday; ++day) {
        const auto weekday = static_cast<Qt::DayOfWeek>(day);
        if (normalized == weekdayToString(weekday)) {
            return weekday;
        }
    }
    return std::nullopt;
}

QString RRuleCodec::formatCanonical(const RecurrenceRule &rule)
{
    QStringList parts;
    parts << QStringLiteral("FREQ=") + frequencyToString(rule.frequency);
    if (rule.interval != 1) {
        parts << QStringLiteral("INTERVAL=%1").arg(rule.interval);
    }
    if (rule.count) {
        parts << QStringLiteral("COUNT=%1").arg(*rule.count);
    }
    if (rule.until) {
        parts << QStringLiteral("UNTIL=") + formatUntil(*rule.until);
    }
    if (rule.byWeekday) {
        QStringList days;
        for (const WeekdayNum &day : *rule.byWeekday) {
            const QString prefix = day.ordinal != 0 ? QString::number(day.ordinal) : QString();
            days << prefix + weekdayToString(day.weekday);
        }
        parts << QStringLiteral("BYDAY=") + days.join(QLatin1Char(','));
    }
    if (rule.byMonthDay) {
        parts << QStringLiteral("BYMONTHDAY=") + joinInts(*rule.byMonthDay);
    }
    if (rule.byMonth) {
        parts << QStringLiteral("BYMONTH=") + joinInts(*rule.byMonth);
    }
    if (rule.weekStart != Qt::Monday) {
        parts << QStringLiteral("WKST=") + weekdayToString(rule.weekStart);
    }
    for (const auto &extension : rule.extensions) {
        parts << extension.first + QLatin1Char('=') + extension.second;
    }
    return parts.join(QLatin1Char(';'));
}

QString RRuleCodec::formatUntil(const RecurrenceUntil &until)
{
    switch (until.form) {
    case UntilForm::Date:
        return until.date.toString(QLatin1String(DATE_FORMAT));
    case UntilForm::FloatingDateTime:
        return QDateTime(until.date, until.time, Qt::UTC).toString(QLatin1String(FLOATING_FORMAT));
    case UntilForm::UtcDateTime:
    default:
        return until.instant().toString(QLatin1String(UTC_FORMAT));
    }
}

std::optional<RecurrenceUntil> RRuleCodec::parseUntil(const QString &value)
{
    RecurrenceUntil until;
    if (value.size() == 8) {
        until.form = UntilForm::Date;
        until.date = QDate::fromString(value, QLatin1String(DATE_FORMAT));
        until.time = QTime(0, 0);
        if (!until.date.isValid()) {
            return std::nullopt;
        }
        return until;
    }

    QString dateTime = value;
    until.form = UntilForm::FloatingDateTime;
    if (value.size() == 16 && value.endsWith(QLatin1Char('Z'))) {
        until.form = UntilForm::UtcDateTime;
        dateTime.chop(1);
    }
    if (dateTime.size() != 15 || dateTime.at(8) != QLatin1Char('T')) {
        return std::nullopt;
    }
    until.date = QDate::fromString(dateTime.left(8), QLatin1String(DATE_FORMAT));
    until.time = QTime::fromString(dateTime.mid(9), QStringLiteral("hhmmss"));
    if (!until.date.isValid() || !until.time.isValid()) {
        return std::nullopt;
    }
    return until;
}

std::optional<WeekdayNum> RRuleCodec::parseWeekdayNum(const QString &value)
{
    if (value.size() < 2) {
        return std::nullopt;
    }
    const auto weekday = weekdayFromString(value.right(2));
    if (!weekday) {
        return std::nullopt;
    }
    WeekdayNum result;
    result.weekday = *weekday;
    const QString ordinal = value.left(value.size() - 2);
    if (!ordinal.isEmpty()) {
        const auto number = parseSignedInt(ordinal);
        if (!number) {
            return std::nullopt;
        }
        result.ordinal = *number;
    }
    return result;
}

std::optional<int> RRuleCodec::parseSignedInt(const QString &value)
{
    if (value.isEmpty()) {
        return std::nullopt;
    }
    int index = 0;
    if (value.at(0) == QLatin1Char('+') || value.at(0) == QLatin1Char('-')) {
        index = 1;
    }
    if (index == value.size()) {
        return std::nullopt;
    }
    for (int i = index; i < value.size(); ++i) {
        if (!value.at(i).isDigit()) {
            return std::nullopt;
        }
    }
    bool ok = false;
    const int number = value.toInt(&ok);
    if (!ok) {
        return std::nullopt;
    }
    return number;
}

} // namespace data
} // namespace agenda
