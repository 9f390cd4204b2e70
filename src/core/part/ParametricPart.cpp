/**
 * @file ParametricPart.cpp
 */
#include "ParametricPart.h"

#include <QLoggingCategory>
#include <QString>

#include <stdexcept>
#include <utility>

namespace partcad::core::part {

Q_LOGGING_CATEGORY(logParametric, "partcad.core.part.parametric")

ParametricPart::ParametricPart(std::shared_ptr<Part> part)
    : part_(std::move(part)) {
    if (!part_) {
        throw std::invalid_argument("ParametricPart requires a part");
    }
}

void ParametricPart::addConstraint(const std::string& first, const std::string& second,
                                   const std::string& relation) {
    constraints_.push_back({first, second, relation});
    if (relation != relations::EQUAL) {
        qCDebug(logParametric) << "addConstraint: relation is stored but not evaluated"
                               << "relation=" << QString::fromStdString(relation);
    }
}

void ParametricPart::updateParameters(const ParameterMap& parameters) {
    for (const auto& [name, value] : parameters) {
        part_->setParameter(name, value);
    }
}

SolveResult ParametricPart::solve() {
    SolveResult result;
    ParameterMap& values = part_->parameters();

    for (const ParameterConstraint& constraint : constraints_) {
        if (!constraint.isEqual()) {
            ++result.inertConstraints;
            continue;
        }

        auto first = values.find(constraint.first);
        if (first != values.end()) {
            values[constraint.second] = first->second;
            result.updatedParameters.push_back(constraint.second);
            ++result.appliedConstraints;
            continue;
        }

        auto second = values.find(constraint.second);
        if (second != values.end()) {
            values[constraint.first] = second->second;
            result.updatedParameters.push_back(constraint.first);
            ++result.appliedConstraints;
            continue;
        }

        ++result.skippedConstraints;
    }

    qCDebug(logParametric) << "solve"
                           << "part=" << QString::fromStdString(part_->name())
                           << "constraints=" << constraints_.size()
                           << "applied=" << result.appliedConstraints
                           << "skipped=" << result.skippedConstraints
                           << "inert=" << result.inertConstraints;
    return result;
}

ParametricPart makeParametric(std::shared_ptr<Part> part) {
    ParametricPart parametric(std::move(part));
    qCDebug(logParametric) << "makeParametric"
                           << "part=" << QString::fromStdString(parametric.part().name());
    return parametric;
}

} // namespace partcad::core::part
