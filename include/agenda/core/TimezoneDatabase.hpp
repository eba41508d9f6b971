#pragma once

#include <QByteArray>
#include <QSet>
#include <QString>
#include <QTimeZone>
#include <memory>
#include <optional>

namespace agenda {
namespace core {

// Process-wide, read-only set of IANA zone identifiers. Loaded once and
// shared between resolvers; never mutated after construction.
class TimezoneDatabase
{
public:
    TimezoneDatabase(QSet<QByteArray> ids, QString version);

    static std::shared_ptr<const TimezoneDatabase> loadSystem(const QString &zoneinfoPath);

    bool contains(const QString &zoneId) const;
    std::optional<QTimeZone> zone(const QString &zoneId) const;
    const QString &version() const;
    int size() const;

private:
    static QString readCompiled(const QString &zoneinfoPath, QSet<QByteArray> &ids);
    static void scanZoneFiles(const QString &zoneinfoPath, QSet<QByteArray> &ids);
    static QString readVersion(const QString &zoneinfoPath);

    QSet<QByteArray> m_ids;
    QString m_version;
};

} // namespace core
} // namespace agenda
