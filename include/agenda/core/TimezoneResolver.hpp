#pragma once

#include <QDateTime>
#include <QString>
#include <QTimeZone>
#include <memory>
#include <optional>

#include "agenda/core/EngineSettings.hpp"
#include "agenda/core/Result.hpp"
#include "agenda/data/LocalDateTime.hpp"

namespace agenda {
namespace core {

class TimezoneDatabase;

enum class LocalTimeKind
{
    Exact,
    Gap,       // skipped by a spring-forward transition
    Ambiguous, // repeated by a fall-back transition
};

struct Resolution
{
    QDateTime instant; // Qt::UTC
    LocalTimeKind kind = LocalTimeKind::Exact;
};

// Converts between wall-clock values and UTC instants for IANA zones.
//
// Gap policy: a nonexistent local time is read with the offset in effect
// before the transition, i.e. it lands as far past the transition as it was
// into the gap. Overlap policy: the instant chosen by AmbiguityPolicy,
// Earlier by default.
class TimezoneResolver
{
public:
    explicit TimezoneResolver(std::shared_ptr<const TimezoneDatabase> database,
                              AmbiguityPolicy policy = AmbiguityPolicy::Earlier);
    ~TimezoneResolver();

    bool validateZone(const QString &zoneId) const;
    std::optional<QTimeZone> zone(const QString &zoneId) const;

    Result<QDateTime> toInstant(const data::LocalDateTime &local, const QString &zoneId) const;
    Result<data::LocalDateTime> toLocal(const QDateTime &instant, const QString &zoneId) const;
    Result<Resolution> resolve(const data::LocalDateTime &local, const QString &zoneId) const;

    // Variants for a zone that has already been validated.
    Resolution resolveIn(const data::LocalDateTime &local, const QTimeZone &zone) const;
    static data::LocalDateTime localIn(const QDateTime &instant, const QTimeZone &zone);

    AmbiguityPolicy ambiguityPolicy() const;
    const TimezoneDatabase &database() const;

private:
    std::shared_ptr<const TimezoneDatabase> m_database;
    AmbiguityPolicy m_policy;
};

} // namespace core
} // namespace agenda
