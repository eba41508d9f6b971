#pragma once

#include <QString>
#include <QStringList>
#include <optional>
#include <vector>

#include "agenda/data/TimeInterval.hpp"

namespace agenda {
namespace data {

enum class ConflictKind
{
    Hard, // identical interval
    Soft, // overlapping, not identical
};

struct ConflictPair
{
    QString first;
    QString second;
    ConflictKind kind = ConflictKind::Soft;
};

struct ConflictGroup
{
    QStringList members; // occurrence ids, by start then input order
    ConflictKind kind = ConflictKind::Soft;
    std::vector<ConflictPair> pairs;
    std::optional<QString> dominant; // advisory, set only when priorities are given
    TimeInterval span;
};

} // namespace data
} // namespace agenda
