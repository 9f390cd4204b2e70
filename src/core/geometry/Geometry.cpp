/**
 * @file Geometry.cpp
 * @brief Implementation of Geometry.
 */
#include "Geometry.h"

#include "../mesh/MeshKernel.h"

#include <QLoggingCategory>
#include <QString>

#include <gp_Dir.hxx>

#include <cmath>
#include <string>
#include <utility>

namespace partcad::core::geometry {

Q_LOGGING_CATEGORY(logGeometry, "partcad.core.geometry")

namespace {

constexpr double kMinAxisLength = 1e-12;

bool isPositiveFinite(double value) {
    return std::isfinite(value) && value > 0.0;
}

} // namespace

Geometry::Geometry(GeometryKind kind, std::optional<TriangleMesh> cache)
    : kind_(std::move(kind)), cache_(std::move(cache)) {
}

Geometry Geometry::box(double width, double height, double depth) {
    if (!isPositiveFinite(width) || !isPositiveFinite(height) || !isPositiveFinite(depth)) {
        throw GeometryConstructionError("Box dimensions must be positive (got "
                                        + std::to_string(width) + ", "
                                        + std::to_string(height) + ", "
                                        + std::to_string(depth) + ")");
    }
    return Geometry(BoxParams{width, height, depth}, std::nullopt);
}

Geometry Geometry::cylinder(double radius, double height) {
    if (!isPositiveFinite(radius) || !isPositiveFinite(height)) {
        throw GeometryConstructionError("Cylinder radius and height must be positive (got "
                                        + std::to_string(radius) + ", "
                                        + std::to_string(height) + ")");
    }
    return Geometry(CylinderParams{radius, height}, std::nullopt);
}

Geometry Geometry::fromMesh(TriangleMesh mesh) {
    std::string reason;
    if (!mesh.validate(&reason)) {
        qCWarning(logGeometry) << "fromMesh: rejected mesh"
                               << "reason=" << QString::fromStdString(reason)
                               << "vertices=" << mesh.vertexCount()
                               << "triangles=" << mesh.triangleCount();
        throw GeometryValidationError("Invalid mesh provided: " + reason);
    }
    return Geometry(MeshParams{}, std::move(mesh));
}

GeometryType Geometry::type() const {
    if (std::holds_alternative<BoxParams>(kind_)) {
        return GeometryType::Box;
    }
    if (std::holds_alternative<CylinderParams>(kind_)) {
        return GeometryType::Cylinder;
    }
    return GeometryType::Mesh;
}

std::optional<BoxParams> Geometry::boxParams() const {
    if (const auto* params = std::get_if<BoxParams>(&kind_)) {
        return *params;
    }
    return std::nullopt;
}

std::optional<CylinderParams> Geometry::cylinderParams() const {
    if (const auto* params = std::get_if<CylinderParams>(&kind_)) {
        return *params;
    }
    return std::nullopt;
}

const TriangleMesh& Geometry::tessellate() const {
    if (cache_) {
        return *cache_;
    }

    const auto& settings = mesh::TessellationSettings::current();
    // A Mesh kind always carries its cache, so only primitives reach the kernel.
    TriangleMesh built;
    try {
        if (std::holds_alternative<BoxParams>(kind_)) {
            const auto& p = std::get<BoxParams>(kind_);
            built = mesh::MeshKernel::tessellateBox(p.width, p.height, p.depth, settings);
        } else if (std::holds_alternative<CylinderParams>(kind_)) {
            const auto& p = std::get<CylinderParams>(kind_);
            built = mesh::MeshKernel::tessellateCylinder(p.radius, p.height,
                                                         settings.cylinderSegments, settings);
        }
    } catch (const mesh::MeshKernelError& e) {
        qCWarning(logGeometry) << "tessellate: kernel failure"
                               << "type=" << geometryTypeName(type())
                               << "error=" << e.what();
        throw GeometryError(std::string("Tessellation of ") + geometryTypeName(type())
                            + " failed: " + e.what());
    }

    if (built.isEmpty()) {
        throw GeometryError(std::string("Tessellation of ") + geometryTypeName(type())
                            + " produced an empty mesh");
    }

    qCDebug(logGeometry) << "tessellate:"
                         << "type=" << geometryTypeName(type())
                         << "vertices=" << built.vertexCount()
                         << "triangles=" << built.triangleCount();
    cache_ = std::move(built);
    return *cache_;
}

Extents Geometry::boundingBox() const {
    return tessellate().extents();
}

Geometry Geometry::translate(double dx, double dy, double dz) const {
    if (!std::isfinite(dx) || !std::isfinite(dy) || !std::isfinite(dz)) {
        throw GeometryError("Translation offsets must be finite");
    }
    return fromMesh(mesh::MeshKernel::translate(tessellate(), gp_Vec(dx, dy, dz)));
}

Geometry Geometry::rotate(double angleDeg, const gp_Vec& axis) const {
    if (!std::isfinite(angleDeg)) {
        throw GeometryError("Rotation angle must be finite");
    }
    if (!std::isfinite(axis.X()) || !std::isfinite(axis.Y()) || !std::isfinite(axis.Z())) {
        throw GeometryError("Rotation axis must be finite");
    }
    if (axis.Magnitude() <= kMinAxisLength) {
        throw GeometryError("Rotation axis must be a non-zero vector");
    }
    return fromMesh(mesh::MeshKernel::rotate(tessellate(), angleDeg, gp_Dir(axis)));
}

Geometry Geometry::clone() const {
    return Geometry(kind_, cache_);
}

const char* geometryTypeName(GeometryType type) {
    switch (type) {
        case GeometryType::Box: return "Box";
        case GeometryType::Cylinder: return "Cylinder";
        case GeometryType::Mesh: return "Mesh";
        default: return "Unknown";
    }
}

} // namespace partcad::core::geometry
