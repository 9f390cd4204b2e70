#include "BooleanOperation.h"

#include "../mesh/MeshKernel.h"

#include <QLoggingCategory>
#include <QString>

#include <exception>
#include <string>
#include <utility>

namespace partcad::core::modeling {

Q_LOGGING_CATEGORY(logBoolean, "partcad.core.boolean")

namespace {

mesh::BooleanKind toKernelKind(BooleanOp op) {
    switch (op) {
        case BooleanOp::Union: return mesh::BooleanKind::Union;
        case BooleanOp::Difference: return mesh::BooleanKind::Difference;
        case BooleanOp::Intersection: return mesh::BooleanKind::Intersection;
    }
    throw geometry::InvalidOperationError("Invalid boolean operation: "
                                          + std::to_string(static_cast<int>(op)));
}

} // namespace

const char* booleanOpName(BooleanOp op) {
    switch (op) {
        case BooleanOp::Union: return "union";
        case BooleanOp::Difference: return "difference";
        case BooleanOp::Intersection: return "intersection";
        default: return "unknown";
    }
}

std::optional<BooleanOp> parseBooleanOp(const std::string& name) {
    if (name == "union") return BooleanOp::Union;
    if (name == "difference") return BooleanOp::Difference;
    if (name == "intersection") return BooleanOp::Intersection;
    return std::nullopt;
}

part::Part BooleanOperation::combine(const part::Part& a, const part::Part& b, BooleanOp op) {
    // Validated before anything else so it is never reported as a boolean failure.
    const mesh::BooleanKind kind = toKernelKind(op);
    const std::string resultName = a.name() + "_" + booleanOpName(op) + "_" + b.name();

    qCDebug(logBoolean) << "combine:start"
                        << "op=" << booleanOpName(op)
                        << "a=" << QString::fromStdString(a.name())
                        << "b=" << QString::fromStdString(b.name());

    try {
        const mesh::TriangleMesh& meshA = a.geometry().tessellate();
        const mesh::TriangleMesh& meshB = b.geometry().tessellate();

        // The kernel re-meshes its output, so the result is triangles only.
        mesh::TriangleMesh combined = mesh::MeshKernel::boolean(meshA, meshB, kind);

        geometry::Geometry resultGeometry = geometry::Geometry::fromMesh(std::move(combined));
        qCInfo(logBoolean) << "combine:done"
                           << "result=" << QString::fromStdString(resultName)
                           << "triangles=" << resultGeometry.tessellate().triangleCount();
        return part::Part(resultName, std::move(resultGeometry));
    } catch (const std::exception& e) {
        qCWarning(logBoolean) << "combine:failed"
                              << "op=" << booleanOpName(op)
                              << "a=" << QString::fromStdString(a.name())
                              << "b=" << QString::fromStdString(b.name())
                              << "error=" << e.what();
        throw geometry::BooleanOperationError(std::string("Boolean operation failed: ") + e.what(),
                                              std::current_exception());
    }
}

part::Part BooleanOperation::combine(const part::Part& a, const part::Part& b, const std::string& opName) {
    const std::optional<BooleanOp> op = parseBooleanOp(opName);
    if (!op) {
        qCWarning(logBoolean) << "combine: invalid operator" << "name=" << QString::fromStdString(opName);
        throw geometry::InvalidOperationError("Invalid boolean operation: " + opName);
    }
    return combine(a, b, *op);
}

} // namespace partcad::core::modeling
