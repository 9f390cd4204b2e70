/**
 * @file TessellationSettings.h
 * @brief Kernel parameters shared by every tessellation and boolean call
 */
#ifndef PARTCAD_CORE_MESH_TESSELLATIONSETTINGS_H
#define PARTCAD_CORE_MESH_TESSELLATIONSETTINGS_H

namespace partcad::core::mesh {

namespace defaults {
constexpr int CYLINDER_SEGMENTS = 32;
// Segment counts are multiples of 4 so vertices land on +-X and +-Y and the
// XY extents of a cylinder are exactly 2r.
constexpr int CYLINDER_SEGMENT_STEP = 4;
constexpr int MIN_CYLINDER_SEGMENTS = 4;
constexpr double LINEAR_DEFLECTION = 0.01;
constexpr double ANGULAR_DEFLECTION = 0.5;   // radians
constexpr double BOOLEAN_FUZZY_VALUE = 1e-7;
constexpr double SEWING_TOLERANCE = 1e-6;
constexpr double WELD_TOLERANCE = 1e-9;
} // namespace defaults

struct TessellationSettings {
    int cylinderSegments = defaults::CYLINDER_SEGMENTS;
    double linearDeflection = defaults::LINEAR_DEFLECTION;
    double angularDeflection = defaults::ANGULAR_DEFLECTION;
    double booleanFuzzyValue = defaults::BOOLEAN_FUZZY_VALUE;
    double sewingTolerance = defaults::SEWING_TOLERANCE;
    bool unifyFaces = true;

    /**
     * @brief Process-wide settings used when a caller does not pass its own
     *
     * Set once at startup (see app::Settings::apply). Not synchronised.
     */
    static const TessellationSettings& current();
    static void setCurrent(const TessellationSettings& settings);
};

} // namespace partcad::core::mesh

#endif // PARTCAD_CORE_MESH_TESSELLATIONSETTINGS_H
