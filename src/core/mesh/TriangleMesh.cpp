/**
 * @file TriangleMesh.cpp
 */
#include "TriangleMesh.h"

#include <gp_XYZ.hxx>

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace partcad::core::mesh {

TriangleMesh::TriangleMesh(std::vector<gp_Pnt> vertices, std::vector<Triangle> triangles)
    : vertices_(std::move(vertices)), triangles_(std::move(triangles)) {
}

int TriangleMesh::addVertex(const gp_Pnt& point) {
    vertices_.push_back(point);
    return static_cast<int>(vertices_.size()) - 1;
}

void TriangleMesh::addTriangle(int a, int b, int c) {
    triangles_.push_back({a, b, c});
}

bool TriangleMesh::validate(std::string* reason) const {
    auto fail = [reason](const char* message) {
        if (reason) {
            *reason = message;
        }
        return false;
    };

    if (vertices_.empty()) {
        return fail("mesh has no vertices");
    }
    if (triangles_.empty()) {
        return fail("mesh has no faces");
    }

    for (const gp_Pnt& point : vertices_) {
        if (!std::isfinite(point.X()) || !std::isfinite(point.Y()) || !std::isfinite(point.Z())) {
            return fail("vertex has non-finite coordinates");
        }
    }

    const int count = static_cast<int>(vertices_.size());
    for (const Triangle& tri : triangles_) {
        for (int index : tri) {
            if (index < 0 || index >= count) {
                return fail("face references a vertex out of range");
            }
        }
    }
    return true;
}

MeshBounds TriangleMesh::bounds() const {
    MeshBounds result;
    if (vertices_.empty()) {
        return result;
    }

    constexpr double kInf = std::numeric_limits<double>::infinity();
    result = {kInf, -kInf, kInf, -kInf, kInf, -kInf};
    for (const gp_Pnt& p : vertices_) {
        result.xmin = std::min(result.xmin, p.X());
        result.xmax = std::max(result.xmax, p.X());
        result.ymin = std::min(result.ymin, p.Y());
        result.ymax = std::max(result.ymax, p.Y());
        result.zmin = std::min(result.zmin, p.Z());
        result.zmax = std::max(result.zmax, p.Z());
    }
    return result;
}

Extents TriangleMesh::extents() const {
    const MeshBounds b = bounds();
    return {b.xmax - b.xmin, b.ymax - b.ymin, b.zmax - b.zmin};
}

gp_Pnt TriangleMesh::centroid() const {
    gp_XYZ weighted(0.0, 0.0, 0.0);
    double totalArea = 0.0;

    for (const Triangle& tri : triangles_) {
        const gp_XYZ& a = vertices_[tri[0]].XYZ();
        const gp_XYZ& b = vertices_[tri[1]].XYZ();
        const gp_XYZ& c = vertices_[tri[2]].XYZ();
        const double area = 0.5 * ((b - a) ^ (c - a)).Modulus();
        weighted += (a + b + c) * (area / 3.0);
        totalArea += area;
    }

    if (totalArea > 0.0) {
        return gp_Pnt(weighted / totalArea);
    }

    // Degenerate surface: fall back to the vertex average.
    gp_XYZ sum(0.0, 0.0, 0.0);
    for (const gp_Pnt& p : vertices_) {
        sum += p.XYZ();
    }
    if (!vertices_.empty()) {
        sum /= static_cast<double>(vertices_.size());
    }
    return gp_Pnt(sum);
}

double TriangleMesh::volume() const {
    double sixVolume = 0.0;
    for (const Triangle& tri : triangles_) {
        const gp_XYZ& a = vertices_[tri[0]].XYZ();
        const gp_XYZ& b = vertices_[tri[1]].XYZ();
        const gp_XYZ& c = vertices_[tri[2]].XYZ();
        sixVolume += a.Dot(b ^ c);
    }
    return sixVolume / 6.0;
}

double TriangleMesh::surfaceArea() const {
    double area = 0.0;
    for (const Triangle& tri : triangles_) {
        const gp_XYZ& a = vertices_[tri[0]].XYZ();
        const gp_XYZ& b = vertices_[tri[1]].XYZ();
        const gp_XYZ& c = vertices_[tri[2]].XYZ();
        area += 0.5 * ((b - a) ^ (c - a)).Modulus();
    }
    return area;
}

TriangleMesh TriangleMesh::transformed(const gp_Trsf& trsf) const {
    std::vector<gp_Pnt> moved;
    moved.reserve(vertices_.size());
    for (const gp_Pnt& p : vertices_) {
        moved.push_back(p.Transformed(trsf));
    }
    return TriangleMesh(std::move(moved), triangles_);
}

} // namespace partcad::core::mesh
