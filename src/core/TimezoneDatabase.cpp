#include "agenda/core/TimezoneDatabase.hpp"

#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QStringList>
#include <QTextStream>
#include <utility>

#include "agenda/core/Logging.hpp"

namespace agenda {
namespace core {

namespace {
// Qt lists "UTC+05:00" style ids next to the IANA names; those are not IANA.
bool isOffsetPseudoId(const QByteArray &id)
{
    return id.size() > 3 && id.startsWith("UTC") && (id.at(3) == '+' || id.at(3) == '-');
}
} // namespace

TimezoneDatabase::TimezoneDatabase(QSet<QByteArray> ids, QString version)
    : m_ids(std::move(ids))
    , m_version(std::move(version))
{
}

std::shared_ptr<const TimezoneDatabase> TimezoneDatabase::loadSystem(const QString &zoneinfoPath)
{
    QSet<QByteArray> ids;
    QString version = readCompiled(zoneinfoPath, ids);
    if (ids.isEmpty()) {
        scanZoneFiles(zoneinfoPath, ids);
    }
    // Qt also offers a plain "UTC" id.
    const QList<QByteArray> available = QTimeZone::availableTimeZoneIds();
    for (const QByteArray &id : available) {
        if (!isOffsetPseudoId(id)) {
            ids.insert(id);
        }
    }
    if (version.isEmpty()) {
        version = readVersion(zoneinfoPath);
    }
    qCDebug(AGENDA_TIMEZONE_LOG) << "Loaded" << ids.size() << "zone ids, tzdata version" << version;
    return std::make_shared<TimezoneDatabase>(std::move(ids), version);
}

bool TimezoneDatabase::contains(const QString &zoneId) const
{
    return !zoneId.isEmpty() && m_ids.contains(zoneId.toUtf8());
}

std::optional<QTimeZone> TimezoneDatabase::zone(const QString &zoneId) const
{
    if (!contains(zoneId)) {
        return std::nullopt;
    }
    QTimeZone zone(zoneId.toUtf8());
    if (!zone.isValid()) {
        qCWarning(AGENDA_TIMEZONE_LOG) << "Zone" << zoneId << "is listed but could not be loaded";
        return std::nullopt;
    }
    return zone;
}

const QString &TimezoneDatabase::version() const
{
    return m_version;
}

int TimezoneDatabase::size() const
{
    return m_ids.size();
}

// tzdata.zi starts with "# version 2024a" and lists every zone as
// "Z <name> ..." and every link as "L <target> <name>".
QString TimezoneDatabase::readCompiled(const QString &zoneinfoPath, QSet<QByteArray> &ids)
{
    QFile compiled(QDir(zoneinfoPath).filePath(QStringLiteral("tzdata.zi")));
    if (!compiled.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return QString();
    }

    QString version;
    const QString prefix = QStringLiteral("# version ");
    QTextStream stream(&compiled);
    while (!stream.atEnd()) {
        const QString line = stream.readLine().trimmed();
        if (line.startsWith(prefix)) {
            version = line.mid(prefix.size()).trimmed();
            continue;
        }
        const QStringList fields = line.split(QLatin1Char(' '), Qt::SkipEmptyParts);
        if (fields.size() >= 2 && fields.at(0) == QLatin1String("Z")) {
            ids.insert(fields.at(1).toUtf8());
        } else if (fields.size() >= 3 && fields.at(0) == QLatin1String("L")) {
            ids.insert(fields.at(2).toUtf8());
        }
    }
    return version;
}

// Without tzdata.zi every TZif file below the root is a zone or a link.
void TimezoneDatabase::scanZoneFiles(const QString &zoneinfoPath, QSet<QByteArray> &ids)
{
    const QDir root(zoneinfoPath);
    QDirIterator it(zoneinfoPath, QDir::Files, QDirIterator::Subdirectories | QDirIterator::FollowSymlinks);
    while (it.hasNext()) {
        const QString path = it.next();
        const QString name = root.relativeFilePath(path);
        if (name.startsWith(QLatin1String("posix/")) || name.startsWith(QLatin1String("right/"))
            || name == QLatin1String("localtime") || name == QLatin1String("posixrules")) {
            continue;
        }
        QFile file(path);
        if (file.open(QIODevice::ReadOnly) && file.read(4) == "TZif") {
            ids.insert(name.toUtf8());
        }
    }
}

QString TimezoneDatabase::readVersion(const QString &zoneinfoPath)
{
    QFile plain(QDir(zoneinfoPath).filePath(QStringLiteral("+VERSION")));
    if (plain.open(QIODevice::ReadOnly | QIODevice::Text)) {
        const QString version = QString::fromUtf8(plain.readAll()).trimmed();
        if (!version.isEmpty()) {
            return version;
        }
    }
    return QStringLiteral("unknown");
}

} // namespace core
} // namespace agenda
