#include "agenda/core/TimezoneResolver.hpp"

#include <QVector>
#include <algorithm>
#include <utility>
#include <vector>

#include "agenda/core/Logging.hpp"
#include "agenda/core/TimezoneDatabase.hpp"

namespace agenda {
namespace core {

namespace {
// Real transitions are months apart; probing a day either side of the
// wall-clock value yields both offsets around any gap or overlap.
constexpr qint64 SampleSecs = 24 * 60 * 60;
} // namespace

TimezoneResolver::TimezoneResolver(std::shared_ptr<const TimezoneDatabase> database, AmbiguityPolicy policy)
    : m_database(std::move(database))
    , m_policy(policy)
{
}

TimezoneResolver::~TimezoneResolver() = default;

bool TimezoneResolver::validateZone(const QString &zoneId) const
{
    return m_database && m_database->contains(zoneId);
}

std::optional<QTimeZone> TimezoneResolver::zone(const QString &zoneId) const
{
    if (!m_database) {
        return std::nullopt;
    }
    return m_database->zone(zoneId);
}

Result<QDateTime> TimezoneResolver::toInstant(const data::LocalDateTime &local, const QString &zoneId) const
{
    auto resolution = resolve(local, zoneId);
    if (!resolution) {
        return resolution.error();
    }
    return resolution.value().instant;
}

Result<data::LocalDateTime> TimezoneResolver::toLocal(const QDateTime &instant, const QString &zoneId) const
{
    const auto tz = zone(zoneId);
    if (!tz) {
        return ScheduleError::invalidTimezone(zoneId);
    }
    if (!instant.isValid()) {
        return ScheduleError::invalidInterval(QStringLiteral("invalid instant"));
    }
    return localIn(instant, *tz);
}

Result<Resolution> TimezoneResolver::resolve(const data::LocalDateTime &local, const QString &zoneId) const
{
    const auto tz = zone(zoneId);
    if (!tz) {
        return ScheduleError::invalidTimezone(zoneId);
    }
    if (!local.isValid()) {
        return ScheduleError::invalidTemplate(QStringLiteral("invalid local date/time"));
    }
    return resolveIn(local, *tz);
}

Resolution TimezoneResolver::resolveIn(const data::LocalDateTime &local, const QTimeZone &zone) const
{
    const QDateTime axis = local.asUtcAxis();

    QVector<int> offsets;
    for (qint64 sample : { -SampleSecs, qint64(0), SampleSecs }) {
        const int offset = zone.offsetFromUtc(axis.addSecs(sample));
        if (!offsets.contains(offset)) {
            offsets.append(offset);
        }
    }

    std::vector<QDateTime> matches;
    for (int offset : offsets) {
        const QDateTime candidate = axis.addSecs(-offset);
        if (zone.offsetFromUtc(candidate) == offset) {
            matches.push_back(candidate);
        }
    }
    std::sort(matches.begin(), matches.end());

    if (matches.empty()) {
        const int before = zone.offsetFromUtc(axis.addSecs(-SampleSecs));
        const QDateTime shifted = axis.addSecs(-before);
        qCDebug(AGENDA_TIMEZONE_LOG) << local.toString() << "does not exist in" << zone.id() << "- shifted to"
                                     << shifted;
        return Resolution{ shifted, LocalTimeKind::Gap };
    }
    if (matches.size() == 1) {
        return Resolution{ matches.front(), LocalTimeKind::Exact };
    }
    const QDateTime chosen = m_policy == AmbiguityPolicy::Later ? matches.back() : matches.front();
    return Resolution{ chosen, LocalTimeKind::Ambiguous };
}

data::LocalDateTime TimezoneResolver::localIn(const QDateTime &instant, const QTimeZone &zone)
{
    const QDateTime utc = instant.toUTC();
    return data::LocalDateTime::fromUtcAxis(utc.addSecs(zone.offsetFromUtc(utc)));
}

AmbiguityPolicy TimezoneResolver::ambiguityPolicy() const
{
    return m_policy;
}

const TimezoneDatabase &TimezoneResolver::database() const
{
    return *m_database;
}

} // namespace core
} // namespace agenda
