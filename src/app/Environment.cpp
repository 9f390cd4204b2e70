/**
 * @file Environment.cpp
 */
#include "Environment.h"

#include <QtGlobal>

namespace partcad::app::env {

bool isEnabledFlag(QStringView value) {
    const QStringView trimmed = value.trimmed();
    for (const char* accepted : {"1", "true", "yes", "on"}) {
        if (trimmed.compare(QLatin1String(accepted), Qt::CaseInsensitive) == 0) {
            return true;
        }
    }
    return false;
}

std::optional<QString> value(const char* name) {
    const QString raw = qEnvironmentVariable(name).trimmed();
    if (raw.isEmpty()) {
        return std::nullopt;
    }
    return raw;
}

std::optional<bool> flag(const char* name) {
    const auto raw = value(name);
    if (!raw) {
        return std::nullopt;
    }
    return isEnabledFlag(*raw);
}

QStringList list(const char* name) {
    QStringList entries;
    const auto raw = value(name);
    if (!raw) {
        return entries;
    }
    for (const QString& token : raw->split(QLatin1Char(','), Qt::SkipEmptyParts)) {
        const QString entry = token.trimmed();
        if (!entry.isEmpty()) {
            entries.push_back(entry);
        }
    }
    entries.removeDuplicates();
    return entries;
}

} // namespace partcad::app::env
