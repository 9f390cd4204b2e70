/**
 * @file MeshKernel.cpp
 * @brief Implementation of MeshKernel.
 */
#include "MeshKernel.h"

#include <QLoggingCategory>

#include <BRepAlgoAPI_Common.hxx>
#include <BRepAlgoAPI_Cut.hxx>
#include <BRepAlgoAPI_Fuse.hxx>
#include <BRepBuilderAPI_MakeFace.hxx>
#include <BRepBuilderAPI_MakePolygon.hxx>
#include <BRepBuilderAPI_MakeSolid.hxx>
#include <BRepBuilderAPI_Sewing.hxx>
#include <BRepLib.hxx>
#include <BRepMesh_IncrementalMesh.hxx>
#include <BRepPrimAPI_MakeBox.hxx>
#include <BRepPrimAPI_MakePrism.hxx>
#include <BRepTools.hxx>
#include <BRep_Tool.hxx>
#include <Poly_Triangulation.hxx>
#include <ShapeUpgrade_UnifySameDomain.hxx>
#include <Standard_Failure.hxx>
#include <TopExp_Explorer.hxx>
#include <TopLoc_Location.hxx>
#include <TopTools_ListOfShape.hxx>
#include <TopoDS.hxx>
#include <TopoDS_Face.hxx>
#include <TopoDS_Solid.hxx>
#include <gp_Ax1.hxx>
#include <gp_Pnt.hxx>
#include <gp_Trsf.hxx>

#include <array>
#include <cmath>
#include <map>
#include <numbers>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace partcad::core::mesh {

Q_LOGGING_CATEGORY(logMeshKernel, "partcad.core.mesh")

namespace {

// Merges nodes that OCCT duplicates per face so shared edges share vertices.
class VertexWelder {
public:
    VertexWelder(TriangleMesh& mesh, double tolerance)
        : mesh_(mesh), tolerance_(tolerance) {}

    int index(const gp_Pnt& point) {
        const Key key{quantize(point.X()), quantize(point.Y()), quantize(point.Z())};
        auto it = lookup_.find(key);
        if (it != lookup_.end()) {
            return it->second;
        }
        const int created = mesh_.addVertex(point);
        lookup_.emplace(key, created);
        return created;
    }

private:
    using Key = std::array<long long, 3>;

    long long quantize(double value) const {
        return std::llround(value / tolerance_);
    }

    TriangleMesh& mesh_;
    double tolerance_;
    std::map<Key, int> lookup_;
};

TriangleMesh extractTriangles(const TopoDS_Shape& shape) {
    TriangleMesh mesh;
    VertexWelder welder(mesh, defaults::WELD_TOLERANCE);

    for (TopExp_Explorer exp(shape, TopAbs_FACE); exp.More(); exp.Next()) {
        const TopoDS_Face& face = TopoDS::Face(exp.Current());
        TopLoc_Location location;
        Handle(Poly_Triangulation) triangulation = BRep_Tool::Triangulation(face, location);
        if (triangulation.IsNull()) {
            throw MeshKernelError("face left untriangulated by BRepMesh");
        }

        const gp_Trsf trsf = location.Transformation();
        const bool reversed = face.Orientation() == TopAbs_REVERSED;

        std::vector<int> nodeIndex(static_cast<std::size_t>(triangulation->NbNodes()) + 1, -1);
        for (int i = 1; i <= triangulation->NbNodes(); ++i) {
            nodeIndex[i] = welder.index(triangulation->Node(i).Transformed(trsf));
        }

        for (int i = 1; i <= triangulation->NbTriangles(); ++i) {
            int n1 = 0;
            int n2 = 0;
            int n3 = 0;
            triangulation->Triangle(i).Get(n1, n2, n3);
            if (reversed) {
                std::swap(n2, n3);
            }
            const int a = nodeIndex[n1];
            const int b = nodeIndex[n2];
            const int c = nodeIndex[n3];
            if (a == b || b == c || a == c) {
                continue;
            }
            mesh.addTriangle(a, b, c);
        }
    }
    return mesh;
}

TriangleMesh meshShape(const TopoDS_Shape& shape, const TessellationSettings& settings) {
    if (shape.IsNull() || !TopExp_Explorer(shape, TopAbs_FACE).More()) {
        return {};
    }

    BRepTools::Clean(shape);
    BRepMesh_IncrementalMesh mesher(shape, settings.linearDeflection, Standard_False,
                                    settings.angularDeflection, Standard_False);
    if (!mesher.IsDone()) {
        throw MeshKernelError("BRepMesh_IncrementalMesh did not complete");
    }
    return extractTriangles(shape);
}

template <typename Algo>
TopoDS_Shape runBoolean(const TopoDS_Shape& argument, const TopoDS_Shape& tool,
                        const TessellationSettings& settings, BooleanKind kind) {
    TopTools_ListOfShape arguments;
    arguments.Append(argument);
    TopTools_ListOfShape tools;
    tools.Append(tool);

    Algo algo;
    algo.SetArguments(arguments);
    algo.SetTools(tools);
    algo.SetFuzzyValue(settings.booleanFuzzyValue);
    algo.SetRunParallel(Standard_False);
    algo.SetNonDestructive(Standard_True);
    algo.Build();

    if (!algo.IsDone() || algo.HasErrors()) {
        std::ostringstream report;
        algo.DumpErrors(report);
        throw MeshKernelError(std::string(booleanKindName(kind)) + " failed: " + report.str());
    }

    TopoDS_Shape result = algo.Shape();
    if (settings.unifyFaces && !result.IsNull()) {
        ShapeUpgrade_UnifySameDomain unify(result, Standard_True, Standard_True, Standard_False);
        unify.Build();
        result = unify.Shape();
    }
    return result;
}

MeshKernelError fromOcct(const char* what, const Standard_Failure& failure) {
    const char* message = failure.GetMessageString();
    return MeshKernelError(std::string(what) + ": " + failure.DynamicType()->Name()
                           + (message && *message ? std::string(" ") + message : std::string()));
}

} // namespace

TriangleMesh MeshKernel::tessellateBox(double width, double height, double depth,
                                       const TessellationSettings& settings) {
    try {
        BRepPrimAPI_MakeBox box(gp_Pnt(-0.5 * width, -0.5 * height, -0.5 * depth),
                                width, height, depth);
        TriangleMesh mesh = meshShape(box.Shape(), settings);
        qCDebug(logMeshKernel) << "tessellateBox"
                               << "w=" << width << "h=" << height << "d=" << depth
                               << "triangles=" << mesh.triangleCount();
        return mesh;
    } catch (const Standard_Failure& failure) {
        throw fromOcct("tessellateBox", failure);
    }
}

TriangleMesh MeshKernel::tessellateCylinder(double radius, double height, int segments,
                                            const TessellationSettings& settings) {
    if (segments < defaults::MIN_CYLINDER_SEGMENTS || segments % defaults::CYLINDER_SEGMENT_STEP != 0) {
        throw MeshKernelError("cylinder segments must be a positive multiple of 4 (got "
                              + std::to_string(segments) + ")");
    }

    try {
        const double z0 = -0.5 * height;
        const double step = 2.0 * std::numbers::pi_v<double> / segments;

        BRepBuilderAPI_MakePolygon polygon;
        for (int i = 0; i < segments; ++i) {
            const double angle = step * i;
            polygon.Add(gp_Pnt(radius * std::cos(angle), radius * std::sin(angle), z0));
        }
        polygon.Close();
        if (!polygon.IsDone()) {
            throw MeshKernelError("cylinder base polygon could not be built");
        }

        BRepBuilderAPI_MakeFace base(polygon.Wire(), Standard_True);
        if (!base.IsDone()) {
            throw MeshKernelError("cylinder base face could not be built");
        }

        BRepPrimAPI_MakePrism prism(base.Face(), gp_Vec(0.0, 0.0, height));
        TriangleMesh mesh = meshShape(prism.Shape(), settings);
        qCDebug(logMeshKernel) << "tessellateCylinder"
                               << "r=" << radius << "h=" << height
                               << "segments=" << segments
                               << "triangles=" << mesh.triangleCount();
        return mesh;
    } catch (const Standard_Failure& failure) {
        throw fromOcct("tessellateCylinder", failure);
    }
}

TopoDS_Shape MeshKernel::toSolid(const TriangleMesh& mesh, const TessellationSettings& settings) {
    std::string reason;
    if (!mesh.validate(&reason)) {
        throw MeshKernelError("cannot build solid: " + reason);
    }

    try {
        BRepBuilderAPI_Sewing sewing(settings.sewingTolerance);
        int faceCount = 0;
        for (const Triangle& tri : mesh.triangles()) {
            const gp_Pnt& a = mesh.vertices()[tri[0]];
            const gp_Pnt& b = mesh.vertices()[tri[1]];
            const gp_Pnt& c = mesh.vertices()[tri[2]];

            const double doubleArea = gp_Vec(a, b).Crossed(gp_Vec(a, c)).Magnitude();
            if (doubleArea <= settings.sewingTolerance * settings.sewingTolerance) {
                continue;
            }

            BRepBuilderAPI_MakePolygon polygon(a, b, c, Standard_True);
            if (!polygon.IsDone()) {
                continue;
            }
            BRepBuilderAPI_MakeFace face(polygon.Wire(), Standard_True);
            if (!face.IsDone()) {
                continue;
            }
            sewing.Add(face.Face());
            ++faceCount;
        }

        if (faceCount == 0) {
            throw MeshKernelError("mesh has no non-degenerate faces");
        }

        sewing.Perform();
        const TopoDS_Shape sewn = sewing.SewedShape();

        BRepBuilderAPI_MakeSolid solidMaker;
        int shellCount = 0;
        for (TopExp_Explorer exp(sewn, TopAbs_SHELL); exp.More(); exp.Next()) {
            solidMaker.Add(TopoDS::Shell(exp.Current()));
            ++shellCount;
        }
        if (shellCount == 0 || !solidMaker.IsDone()) {
            throw MeshKernelError("sewing did not produce a shell");
        }

        TopoDS_Solid solid = solidMaker.Solid();
        if (!BRepLib::OrientClosedSolid(solid)) {
            qCWarning(logMeshKernel) << "toSolid: solid could not be oriented"
                                     << "faces=" << faceCount << "shells=" << shellCount;
        }
        return solid;
    } catch (const Standard_Failure& failure) {
        throw fromOcct("toSolid", failure);
    }
}

TriangleMesh MeshKernel::triangulate(const TopoDS_Shape& shape, const TessellationSettings& settings) {
    try {
        return meshShape(shape, settings);
    } catch (const Standard_Failure& failure) {
        throw fromOcct("triangulate", failure);
    }
}

TriangleMesh MeshKernel::boolean(const TriangleMesh& a, const TriangleMesh& b, BooleanKind kind,
                                 const TessellationSettings& settings) {
    qCDebug(logMeshKernel) << "boolean:start"
                           << "kind=" << booleanKindName(kind)
                           << "trianglesA=" << a.triangleCount()
                           << "trianglesB=" << b.triangleCount();

    const TopoDS_Shape solidA = toSolid(a, settings);
    const TopoDS_Shape solidB = toSolid(b, settings);

    TopoDS_Shape result;
    try {
        switch (kind) {
            case BooleanKind::Union:
                result = runBoolean<BRepAlgoAPI_Fuse>(solidA, solidB, settings, kind);
                break;
            case BooleanKind::Difference:
                result = runBoolean<BRepAlgoAPI_Cut>(solidA, solidB, settings, kind);
                break;
            case BooleanKind::Intersection:
                result = runBoolean<BRepAlgoAPI_Common>(solidA, solidB, settings, kind);
                break;
            default:
                throw MeshKernelError("unknown boolean kind");
        }
    } catch (const Standard_Failure& failure) {
        throw fromOcct(booleanKindName(kind), failure);
    }

    TriangleMesh mesh = triangulate(result, settings);
    qCDebug(logMeshKernel) << "boolean:done"
                           << "kind=" << booleanKindName(kind)
                           << "triangles=" << mesh.triangleCount();
    return mesh;
}

TriangleMesh MeshKernel::booleanUnion(const TriangleMesh& a, const TriangleMesh& b,
                                      const TessellationSettings& settings) {
    return boolean(a, b, BooleanKind::Union, settings);
}

TriangleMesh MeshKernel::booleanDifference(const TriangleMesh& a, const TriangleMesh& b,
                                           const TessellationSettings& settings) {
    return boolean(a, b, BooleanKind::Difference, settings);
}

TriangleMesh MeshKernel::booleanIntersection(const TriangleMesh& a, const TriangleMesh& b,
                                             const TessellationSettings& settings) {
    return boolean(a, b, BooleanKind::Intersection, settings);
}

TriangleMesh MeshKernel::translate(const TriangleMesh& mesh, const gp_Vec& offset) {
    gp_Trsf trsf;
    trsf.SetTranslation(offset);
    return mesh.transformed(trsf);
}

TriangleMesh MeshKernel::rotate(const TriangleMesh& mesh, double angleDeg, const gp_Dir& axis) {
    gp_Trsf trsf;
    trsf.SetRotation(gp_Ax1(gp_Pnt(0.0, 0.0, 0.0), axis), angleDeg * std::numbers::pi_v<double> / 180.0);
    return mesh.transformed(trsf);
}

// ─────────────────────────────────────────────────────────────────────────────
// TessellationSettings
// ─────────────────────────────────────────────────────────────────────────────

namespace {
TessellationSettings gCurrentSettings;
} // namespace

const TessellationSettings& TessellationSettings::current() {
    return gCurrentSettings;
}

void TessellationSettings::setCurrent(const TessellationSettings& settings) {
    gCurrentSettings = settings;
}

} // namespace partcad::core::mesh
