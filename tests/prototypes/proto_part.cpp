/**
 * @file proto_part.cpp
 * @brief Prototype tests for Part and ParametricPart.
 *
 * Test cases:
 * 1. Factory names and parameter maps
 * 2. Transforms carry parameters and keep the source intact
 * 3. clone is a deep copy
 * 4. "equal" propagates first -> second, or second -> first
 * 5. Missing parameters and other relations leave the map alone
 * 6. One ordered pass: later constraints see earlier writes
 * 7. makeParametric shares the part instead of copying it
 */

#include "core/part/ParametricPart.h"
#include "core/part/Part.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include <stdexcept>

using namespace partcad::core;
using part::ParameterMap;
using part::ParametricPart;
using part::Part;

namespace {

bool nearlyEqual(double a, double b, double tol = 1e-6) {
    return std::abs(a - b) <= tol;
}

} // namespace

void testFactories() {
    std::cout << "Test 1: Part factories..." << std::flush;

    const Part box = Part::box(10.0, 20.0, 30.0);
    assert(box.name() == "Box");
    assert(box.parameters().size() == 3);
    assert(box.parameter("width") == 10.0);
    assert(box.parameter("height") == 20.0);
    assert(box.parameter("depth") == 30.0);
    assert(!box.parameter("radius").has_value());

    const Part cylinder = Part::cylinder(4.0, 8.0);
    assert(cylinder.name() == "Cylinder");
    assert(cylinder.parameters() == (ParameterMap{{"radius", 4.0}, {"height", 8.0}}));

    assert(part::parameterNames(geometry::GeometryType::Box).size() == 3);
    assert(part::parameterNames(geometry::GeometryType::Cylinder).size() == 2);
    assert(part::parameterNames(geometry::GeometryType::Mesh).empty());

    bool threw = false;
    try {
        Part::box(10.0, -1.0, 1.0);
    } catch (const geometry::GeometryConstructionError&) {
        threw = true;
    }
    assert(threw);

    std::cout << " PASS\n";
}

void testTransforms() {
    std::cout << "Test 2: Part transforms..." << std::flush;

    Part box = Part::box(2.0, 4.0, 6.0);
    box.setName("Bracket");

    const Part moved = box.translate(1.0, 2.0, 3.0);
    assert(moved.name() == "Bracket");
    assert(moved.parameters() == box.parameters());
    assert(moved.geometry().type() == geometry::GeometryType::Mesh);

    const gp_Pnt c0 = box.geometry().tessellate().centroid();
    const gp_Pnt c1 = moved.geometry().tessellate().centroid();
    assert(nearlyEqual(c1.X() - c0.X(), 1.0, 1e-9));
    assert(nearlyEqual(c1.Y() - c0.Y(), 2.0, 1e-9));
    assert(nearlyEqual(c1.Z() - c0.Z(), 3.0, 1e-9));

    const Part turned = box.rotate(90.0, gp_Vec(0.0, 0.0, 1.0));
    const geometry::Extents e = turned.geometry().boundingBox();
    assert(nearlyEqual(e.width, 4.0) && nearlyEqual(e.height, 2.0) && nearlyEqual(e.depth, 6.0));
    assert(turned.parameters() == box.parameters());

    // Parameters describe the original primitive, not the rotated mesh.
    assert(turned.parameter("width") == 2.0);
    assert(box.geometry().type() == geometry::GeometryType::Box);

    std::cout << " PASS\n";
}

void testClone() {
    std::cout << "Test 3: Part clone..." << std::flush;

    const Part original = Part::cylinder(1.0, 2.0);
    Part copy = original.clone();
    copy.setParameter("radius", 99.0);
    copy.setName("Copy");

    assert(original.parameter("radius") == 1.0);
    assert(original.name() == "Cylinder");
    assert(copy.parameter("radius") == 99.0);
    assert(copy.geometry().type() == geometry::GeometryType::Cylinder);

    std::cout << " PASS\n";
}

void testEqualPropagation() {
    std::cout << "Test 4: Equal constraint propagation..." << std::flush;

    auto shared = std::make_shared<Part>(Part::box(10.0, 5.0, 1.0));
    shared->parameters().erase("height");

    ParametricPart parametric(shared);
    parametric.addConstraint("width", "height", "equal");
    const part::SolveResult result = parametric.solve();
    assert(result.success);
    assert(result.appliedConstraints == 1);
    assert(shared->parameter("height") == 10.0);
    assert(result.updatedParameters.size() == 1 && result.updatedParameters[0] == "height");

    // Second -> first when only the second exists.
    auto reverse = std::make_shared<Part>(Part::cylinder(3.0, 7.0));
    ParametricPart backwards(reverse);
    backwards.addConstraint("diameter", "radius", "equal");
    backwards.solve();
    assert(reverse->parameter("diameter") == 3.0);
    assert(reverse->parameter("radius") == 3.0);

    // Existing second value is overwritten by first.
    ParametricPart overwrite(std::make_shared<Part>(Part::box(1.0, 2.0, 3.0)));
    overwrite.addConstraint("depth", "width", "equal");
    overwrite.solve();
    assert(overwrite.part().parameter("width") == 3.0);

    std::cout << " PASS\n";
}

void testNoOpConstraints() {
    std::cout << "Test 5: Missing and inert constraints..." << std::flush;

    auto shared = std::make_shared<Part>(Part::box(10.0, 20.0, 30.0));
    const ParameterMap before = shared->parameters();

    ParametricPart parametric(shared);
    parametric.addConstraint("alpha", "beta", "equal");
    parametric.addConstraint("width", "height", "greater_than");
    parametric.addConstraint("width", "depth", "parallel");

    const part::SolveResult result = parametric.solve();
    assert(result.success);
    assert(result.appliedConstraints == 0);
    assert(result.skippedConstraints == 1);
    assert(result.inertConstraints == 2);
    assert(result.updatedParameters.empty());
    assert(shared->parameters() == before);
    assert(parametric.constraints().size() == 3);
    assert(!parametric.constraints()[1].isEqual());

    bool threw = false;
    try {
        ParametricPart invalid(nullptr);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << " PASS\n";
}

void testOrderedPass() {
    std::cout << "Test 6: Single ordered pass..." << std::flush;

    auto shared = std::make_shared<Part>(Part("Plate", geometry::Geometry::box(1.0, 1.0, 1.0)));
    ParametricPart parametric(shared);
    parametric.updateParameters({{"a", 4.0}});

    // b is written by the first constraint and read by the second.
    parametric.addConstraint("a", "b", "equal");
    parametric.addConstraint("b", "c", "equal");
    parametric.solve();
    assert(shared->parameter("b") == 4.0);
    assert(shared->parameter("c") == 4.0);

    // Reversed order: the first constraint sees neither parameter yet.
    auto late = std::make_shared<Part>(Part("Late", geometry::Geometry::box(1.0, 1.0, 1.0)));
    ParametricPart lateParametric(late);
    lateParametric.updateParameters({{"a", 4.0}});
    lateParametric.addConstraint("b", "c", "equal");
    lateParametric.addConstraint("a", "b", "equal");
    const part::SolveResult first = lateParametric.solve();
    assert(first.skippedConstraints == 1);
    assert(!late->hasParameter("c"));
    assert(late->parameter("b") == 4.0);

    // A second pass picks up what the first one left behind.
    lateParametric.solve();
    assert(late->parameter("c") == 4.0);

    // updateParameters overwrites and merges.
    lateParametric.updateParameters({{"a", 9.0}, {"z", 1.0}});
    assert(late->parameter("a") == 9.0);
    assert(late->parameter("z") == 1.0);
    assert(late->parameter("b") == 4.0);

    std::cout << " PASS\n";
}

void testMakeParametric() {
    std::cout << "Test 7: makeParametric shares the part..." << std::flush;

    auto shared = std::make_shared<Part>(Part::box(10.0, 20.0, 30.0));
    ParametricPart parametric = part::makeParametric(shared);
    assert(parametric.sharedPart() == shared);
    assert(&parametric.part() == shared.get());
    assert(shared.use_count() == 2);

    parametric.updateParameters({{"width", 25.0}});
    parametric.addConstraint("width", "depth", "equal");
    const part::SolveResult result = parametric.solve();
    assert(result.appliedConstraints == 1);
    assert(shared->parameter("width") == 25.0);
    assert(shared->parameter("depth") == 25.0);

    bool threw = false;
    try {
        part::makeParametric(std::shared_ptr<Part>());
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << " PASS\n";
}

int main() {
    std::cout << "\n=== Part Prototype Tests ===\n\n";

    testFactories();
    testTransforms();
    testClone();
    testEqualPropagation();
    testNoOpConstraints();
    testOrderedPass();
    testMakeParametric();

    std::cout << "\n=== All tests passed! ===\n\n";
    return 0;
}
