#include "agenda/core/EngineSettings.hpp"

#include <QLoggingCategory>
#include <QSettings>
#include <QtGlobal>

#include "agenda/core/Logging.hpp"

namespace agenda {
namespace core {

namespace {
constexpr int MinPeriods = 100;
constexpr int MaxPeriods = 10000000;

QString policyToString(AmbiguityPolicy policy)
{
    return policy == AmbiguityPolicy::Later ? QStringLiteral("later") : QStringLiteral("earlier");
}
} // namespace

EngineSettings EngineSettings::load(QSettings &settings)
{
    EngineSettings result;
    const int storedPeriods = settings.value(QStringLiteral("recurrence/maxPeriods"), result.maxPeriods).toInt();
    result.maxPeriods = qBound(MinPeriods, storedPeriods, MaxPeriods);

    const QString policy = settings.value(QStringLiteral("timezone/ambiguity"), policyToString(result.ambiguity))
                               .toString()
                               .trimmed()
                               .toLower();
    if (policy == QLatin1String("later")) {
        result.ambiguity = AmbiguityPolicy::Later;
    } else if (policy != QLatin1String("earlier")) {
        qCWarning(AGENDA_DATA_LOG) << "Unknown timezone/ambiguity value" << policy << "- using earlier";
    }

    result.zoneinfoPath = settings.value(QStringLiteral("timezone/zoneinfoPath"), result.zoneinfoPath).toString();
    result.loggingRules = settings.value(QStringLiteral("logging/rules")).toString();
    return result;
}

void EngineSettings::save(QSettings &settings) const
{
    settings.setValue(QStringLiteral("recurrence/maxPeriods"), maxPeriods);
    settings.setValue(QStringLiteral("timezone/ambiguity"), policyToString(ambiguity));
    settings.setValue(QStringLiteral("timezone/zoneinfoPath"), zoneinfoPath);
    settings.setValue(QStringLiteral("logging/rules"), loggingRules);
}

void EngineSettings::applyLoggingRules() const
{
    if (loggingRules.isEmpty()) {
        return;
    }
    // Rules are stored ';'-separated to fit a single settings value.
    QString rules = loggingRules;
    rules.replace(QLatin1Char(';'), QLatin1Char('\n'));
    QLoggingCategory::setFilterRules(rules);
}

} // namespace core
} // namespace agenda
