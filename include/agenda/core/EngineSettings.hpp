#pragma once

#include <QString>

class QSettings;

namespace agenda {
namespace core {

// Which instant a wall-clock time inside a fall-back overlap maps to.
enum class AmbiguityPolicy
{
    Earlier,
    Later,
};

struct EngineSettings
{
    // Consecutive recurrence periods without a candidate before a scan gives up.
    int maxPeriods = 50000;
    AmbiguityPolicy ambiguity = AmbiguityPolicy::Earlier;
    QString zoneinfoPath = QStringLiteral("/usr/share/zoneinfo");
    QString loggingRules;

    static EngineSettings load(QSettings &settings);
    void save(QSettings &settings) const;

    void applyLoggingRules() const;
};

} // namespace core
} // namespace agenda
