/**
 * @file Environment.h
 * @brief Readers for PARTCAD_* environment switches
 */
#ifndef PARTCAD_APP_ENVIRONMENT_H
#define PARTCAD_APP_ENVIRONMENT_H

#include <QString>
#include <QStringList>
#include <QStringView>

#include <optional>

namespace partcad::app::env {

/**
 * @brief True for "1", "true", "yes" or "on", ignoring case and surrounding blanks
 */
bool isEnabledFlag(QStringView value);

/**
 * @brief Trimmed value of @p name, or nullopt when it is unset or blank
 */
std::optional<QString> value(const char* name);

/**
 * @brief Flag value of @p name, or nullopt when it is unset or blank
 */
std::optional<bool> flag(const char* name);

/**
 * @brief Comma separated entries of @p name, trimmed, without blanks or duplicates
 */
QStringList list(const char* name);

} // namespace partcad::app::env

#endif // PARTCAD_APP_ENVIRONMENT_H
