/**
 * @file Settings.h
 * @brief Persistent kernel configuration with environment overrides
 */
#ifndef PARTCAD_APP_SETTINGS_H
#define PARTCAD_APP_SETTINGS_H

#include "../core/mesh/TessellationSettings.h"

namespace partcad::app {

/**
 * @brief Application settings
 *
 * Stored with QSettings under organisation/application "PartCAD" in the
 * "kernel" group. Environment variables take precedence:
 * - PARTCAD_CYLINDER_SEGMENTS
 * - PARTCAD_BOOLEAN_FUZZY
 * - PARTCAD_UNIFY_FACES
 */
struct Settings {
    core::mesh::TessellationSettings kernel;

    /**
     * @brief Load stored values, then apply environment overrides
     *
     * Out-of-range values are replaced by the defaults with a warning.
     */
    static Settings load();

    void save() const;

    /**
     * @brief Install the kernel settings as the process-wide defaults
     */
    void apply() const;
};

} // namespace partcad::app

#endif // PARTCAD_APP_SETTINGS_H
