/**
 * @file Part.cpp
 */
#include "Part.h"

#include <QLoggingCategory>
#include <QString>

#include <utility>

namespace partcad::core::part {

Q_LOGGING_CATEGORY(logPart, "partcad.core.part")

std::vector<std::string> parameterNames(geometry::GeometryType type) {
    switch (type) {
        case geometry::GeometryType::Box:
            return {params::WIDTH, params::HEIGHT, params::DEPTH};
        case geometry::GeometryType::Cylinder:
            return {params::RADIUS, params::HEIGHT};
        case geometry::GeometryType::Mesh:
        default:
            return {};
    }
}

Part::Part(std::string name, geometry::Geometry geometry, ParameterMap parameters)
    : name_(std::move(name)), geometry_(std::move(geometry)), parameters_(std::move(parameters)) {
}

Part Part::box(double width, double height, double depth) {
    return Part("Box", geometry::Geometry::box(width, height, depth),
                {{params::WIDTH, width}, {params::HEIGHT, height}, {params::DEPTH, depth}});
}

Part Part::cylinder(double radius, double height) {
    return Part("Cylinder", geometry::Geometry::cylinder(radius, height),
                {{params::RADIUS, radius}, {params::HEIGHT, height}});
}

std::optional<double> Part::parameter(const std::string& name) const {
    auto it = parameters_.find(name);
    if (it != parameters_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool Part::hasParameter(const std::string& name) const {
    return parameters_.find(name) != parameters_.end();
}

void Part::setParameter(const std::string& name, double value) {
    parameters_[name] = value;
}

Part Part::translate(double dx, double dy, double dz) const {
    qCDebug(logPart) << "translate" << "part=" << QString::fromStdString(name_)
                     << "offset=" << dx << dy << dz;
    return Part(name_, geometry_.translate(dx, dy, dz), parameters_);
}

Part Part::rotate(double angleDeg, const gp_Vec& axis) const {
    qCDebug(logPart) << "rotate" << "part=" << QString::fromStdString(name_)
                     << "angleDeg=" << angleDeg
                     << "axis=" << axis.X() << axis.Y() << axis.Z();
    return Part(name_, geometry_.rotate(angleDeg, axis), parameters_);
}

Part Part::clone() const {
    return Part(name_, geometry_.clone(), parameters_);
}

} // namespace partcad::core::part
