/**
 * @file proto_mesh_kernel.cpp
 * @brief Prototype tests for TriangleMesh and MeshKernel.
 *
 * Test cases:
 * 1. Box tessellation: centred bounds, closed volume, valid indices
 * 2. Cylinder tessellation: 2r x 2r x h extents, polygon prism volume,
 *    segment counts restricted to multiples of 4
 * 3. Mesh validation rejects empty meshes, bad indices and non-finite points
 * 4. Translate/rotate move bounds as expected
 * 5. toSolid sews a box mesh into a closed B-rep solid
 * 6. Booleans: difference/union/intersection volumes
 * 7. Disjoint intersection yields an empty mesh
 */

#include "core/mesh/MeshKernel.h"
#include "core/mesh/TriangleMesh.h"

#include <BRepGProp.hxx>
#include <GProp_GProps.hxx>
#include <TopAbs_ShapeEnum.hxx>

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <numbers>
#include <string>

using namespace partcad::core::mesh;

namespace {

bool nearlyEqual(double a, double b, double tol = 1e-6) {
    return std::abs(a - b) <= tol;
}

double polygonPrismVolume(double radius, double height, int segments) {
    const double area = 0.5 * segments * radius * radius * std::sin(2.0 * std::numbers::pi / segments);
    return area * height;
}

} // namespace

void testBoxTessellation() {
    std::cout << "Test 1: Box tessellation..." << std::flush;

    TriangleMesh mesh = MeshKernel::tessellateBox(2.0, 4.0, 6.0);
    std::string reason;
    assert(mesh.validate(&reason));
    assert(mesh.triangleCount() >= 12);

    const MeshBounds b = MeshKernel::bounds(mesh);
    assert(nearlyEqual(b.xmin, -1.0) && nearlyEqual(b.xmax, 1.0));
    assert(nearlyEqual(b.ymin, -2.0) && nearlyEqual(b.ymax, 2.0));
    assert(nearlyEqual(b.zmin, -3.0) && nearlyEqual(b.zmax, 3.0));

    // Outward winding gives a positive volume.
    assert(nearlyEqual(mesh.volume(), 48.0, 1e-6));
    assert(nearlyEqual(mesh.surfaceArea(), 2.0 * (8.0 + 12.0 + 24.0), 1e-6));

    const gp_Pnt c = mesh.centroid();
    assert(nearlyEqual(c.X(), 0.0) && nearlyEqual(c.Y(), 0.0) && nearlyEqual(c.Z(), 0.0));

    std::cout << " PASS\n";
}

void testCylinderTessellation() {
    std::cout << "Test 2: Cylinder tessellation..." << std::flush;

    TriangleMesh mesh = MeshKernel::tessellateCylinder(5.0, 6.0, 32);
    assert(mesh.validate());

    const Extents e = mesh.extents();
    assert(nearlyEqual(e.width, 10.0, 1e-9));
    assert(nearlyEqual(e.height, 10.0, 1e-9));
    assert(nearlyEqual(e.depth, 6.0, 1e-9));

    const MeshBounds b = mesh.bounds();
    assert(nearlyEqual(b.zmin, -3.0) && nearlyEqual(b.zmax, 3.0));

    assert(nearlyEqual(mesh.volume(), polygonPrismVolume(5.0, 6.0, 32), 1e-6));

    // Same inputs, same mesh.
    TriangleMesh again = MeshKernel::tessellateCylinder(5.0, 6.0, 32);
    assert(again.vertexCount() == mesh.vertexCount());
    assert(again.triangleCount() == mesh.triangleCount());

    // The smallest allowed polygon still spans 2r in X and Y.
    const Extents square = MeshKernel::tessellateCylinder(2.0, 1.0, 4).extents();
    assert(nearlyEqual(square.width, 4.0, 1e-9));
    assert(nearlyEqual(square.height, 4.0, 1e-9));

    // Counts that would miss the +-Y (or +-X) vertices are refused.
    for (int segments : {2, 3, 6, 30, 33}) {
        bool threw = false;
        try {
            MeshKernel::tessellateCylinder(5.0, 6.0, segments);
        } catch (const MeshKernelError&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << " PASS\n";
}

void testMeshValidation() {
    std::cout << "Test 3: Mesh validation..." << std::flush;

    TriangleMesh empty;
    std::string reason;
    assert(empty.isEmpty());
    assert(!empty.validate(&reason));
    assert(!reason.empty());

    TriangleMesh noFaces;
    noFaces.addVertex(gp_Pnt(0, 0, 0));
    assert(!noFaces.validate());

    TriangleMesh badIndex;
    badIndex.addVertex(gp_Pnt(0, 0, 0));
    badIndex.addVertex(gp_Pnt(1, 0, 0));
    badIndex.addVertex(gp_Pnt(0, 1, 0));
    badIndex.addTriangle(0, 1, 3);
    reason.clear();
    assert(!badIndex.validate(&reason));
    assert(!reason.empty());

    TriangleMesh negativeIndex;
    negativeIndex.addVertex(gp_Pnt(0, 0, 0));
    negativeIndex.addVertex(gp_Pnt(1, 0, 0));
    negativeIndex.addVertex(gp_Pnt(0, 1, 0));
    negativeIndex.addTriangle(-1, 1, 2);
    assert(!negativeIndex.validate());

    TriangleMesh single;
    single.addVertex(gp_Pnt(0, 0, 0));
    single.addVertex(gp_Pnt(1, 0, 0));
    single.addVertex(gp_Pnt(0, 1, 0));
    single.addTriangle(0, 1, 2);
    assert(single.validate());
    assert(nearlyEqual(single.surfaceArea(), 0.5));

    TriangleMesh infinite;
    infinite.addVertex(gp_Pnt(0, 0, 0));
    infinite.addVertex(gp_Pnt(1, 0, std::numeric_limits<double>::infinity()));
    infinite.addVertex(gp_Pnt(0, 1, 0));
    infinite.addTriangle(0, 1, 2);
    reason.clear();
    assert(!infinite.validate(&reason));
    assert(reason.find("non-finite") != std::string::npos);

    std::cout << " PASS\n";
}

void testTransforms() {
    std::cout << "Test 4: Translate and rotate..." << std::flush;

    const TriangleMesh box = MeshKernel::tessellateBox(2.0, 4.0, 6.0);

    const TriangleMesh moved = MeshKernel::translate(box, gp_Vec(10.0, -5.0, 1.5));
    const MeshBounds mb = moved.bounds();
    assert(nearlyEqual(mb.xmin, 9.0) && nearlyEqual(mb.xmax, 11.0));
    assert(nearlyEqual(mb.ymin, -7.0) && nearlyEqual(mb.ymax, -3.0));
    assert(nearlyEqual(mb.zmin, -1.5) && nearlyEqual(mb.zmax, 4.5));
    assert(moved.triangleCount() == box.triangleCount());

    const TriangleMesh rotated = MeshKernel::rotate(box, 90.0, gp_Dir(0.0, 0.0, 1.0));
    const Extents re = rotated.extents();
    assert(nearlyEqual(re.width, 4.0, 1e-9));
    assert(nearlyEqual(re.height, 2.0, 1e-9));
    assert(nearlyEqual(re.depth, 6.0, 1e-9));
    assert(nearlyEqual(rotated.volume(), box.volume(), 1e-9));

    // Source is untouched.
    assert(nearlyEqual(box.extents().width, 2.0));

    std::cout << " PASS\n";
}

void testToSolid() {
    std::cout << "Test 5: Sew mesh into solid..." << std::flush;

    const TriangleMesh box = MeshKernel::tessellateBox(10.0, 10.0, 10.0);
    const TopoDS_Shape solid = MeshKernel::toSolid(box);
    assert(!solid.IsNull());
    assert(solid.ShapeType() == TopAbs_SOLID);

    GProp_GProps props;
    BRepGProp::VolumeProperties(solid, props);
    assert(nearlyEqual(props.Mass(), 1000.0, 1e-3));

    bool threw = false;
    try {
        MeshKernel::toSolid(TriangleMesh());
    } catch (const MeshKernelError&) {
        threw = true;
    }
    assert(threw);

    std::cout << " PASS\n";
}

void testBooleans() {
    std::cout << "Test 6: Boolean volumes..." << std::flush;

    const TriangleMesh box = MeshKernel::tessellateBox(20.0, 30.0, 10.0);
    const TriangleMesh rod = MeshKernel::tessellateCylinder(5.0, 12.0, 32);

    // Rod pierces the box along Z: 10 units of it are removed.
    const TriangleMesh cut = MeshKernel::booleanDifference(box, rod);
    assert(cut.validate());
    const double expectedCut = 6000.0 - polygonPrismVolume(5.0, 10.0, 32);
    assert(nearlyEqual(cut.volume(), expectedCut, 1e-3));
    assert(cut.volume() < box.volume());

    const TriangleMesh a = MeshKernel::tessellateBox(10.0, 10.0, 10.0);
    const TriangleMesh b = MeshKernel::translate(a, gp_Vec(5.0, 5.0, 5.0));

    const TriangleMesh fused = MeshKernel::booleanUnion(a, b);
    assert(nearlyEqual(fused.volume(), 2000.0 - 125.0, 1e-3));
    assert(fused.volume() <= a.volume() + b.volume());

    const TriangleMesh common = MeshKernel::booleanIntersection(a, b);
    assert(nearlyEqual(common.volume(), 125.0, 1e-3));
    const Extents ce = common.extents();
    assert(nearlyEqual(ce.width, 5.0, 1e-6) && nearlyEqual(ce.height, 5.0, 1e-6)
           && nearlyEqual(ce.depth, 5.0, 1e-6));

    std::cout << " PASS\n";
}

void testDisjointIntersection() {
    std::cout << "Test 7: Disjoint intersection is empty..." << std::flush;

    const TriangleMesh a = MeshKernel::tessellateBox(1.0, 1.0, 1.0);
    const TriangleMesh b = MeshKernel::translate(a, gp_Vec(10.0, 0.0, 0.0));

    const TriangleMesh common = MeshKernel::booleanIntersection(a, b);
    assert(common.isEmpty());
    assert(!common.validate());

    std::cout << " PASS\n";
}

int main() {
    std::cout << "\n=== MeshKernel Prototype Tests ===\n\n";

    testBoxTessellation();
    testCylinderTessellation();
    testMeshValidation();
    testTransforms();
    testToSolid();
    testBooleans();
    testDisjointIntersection();

    std::cout << "\n=== All tests passed! ===\n\n";
    return 0;
}
