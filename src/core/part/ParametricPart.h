/**
 * @file ParametricPart.h
 * @brief Pairwise parameter constraints attached to a shared Part
 *
 * The solver is deliberately minimal: solve() makes exactly one pass over the
 * constraints in insertion order, and only the "equal" relation propagates
 * values. Because constraints run in order, a later constraint sees values
 * written by an earlier one during the same pass. Other relation names are
 * kept but never evaluated, and conflicts are not detected.
 */
#ifndef PARTCAD_CORE_PART_PARAMETRICPART_H
#define PARTCAD_CORE_PART_PARAMETRICPART_H

#include "Part.h"

#include <memory>
#include <string>
#include <vector>

namespace partcad::core::part {

namespace relations {
constexpr const char* EQUAL = "equal";
} // namespace relations

struct ParameterConstraint {
    std::string first;
    std::string second;
    std::string relation;

    bool isEqual() const { return relation == relations::EQUAL; }
};

/**
 * @brief Result of a solve pass
 *
 * success is always true: this solver cannot detect unsatisfiable sets.
 */
struct SolveResult {
    bool success = true;
    int appliedConstraints = 0;   ///< "equal" constraints that wrote a value
    int skippedConstraints = 0;   ///< "equal" constraints with neither parameter present
    int inertConstraints = 0;     ///< constraints with a relation other than "equal"
    std::vector<std::string> updatedParameters;
};

class ParametricPart {
public:
    /**
     * @throws std::invalid_argument if @p part is null
     */
    explicit ParametricPart(std::shared_ptr<Part> part);

    Part& part() { return *part_; }
    const Part& part() const { return *part_; }
    const std::shared_ptr<Part>& sharedPart() const { return part_; }

    void addConstraint(const std::string& first, const std::string& second, const std::string& relation);
    const std::vector<ParameterConstraint>& constraints() const { return constraints_; }

    /**
     * @brief Merge @p parameters into the part, overwriting existing names
     */
    void updateParameters(const ParameterMap& parameters);

    SolveResult solve();

private:
    std::shared_ptr<Part> part_;
    std::vector<ParameterConstraint> constraints_;
};

/**
 * @brief Wrap an existing shared part for constraint solving
 *
 * The part is not copied: parameter edits made through the result are seen by
 * every other holder of @p part, for instance a Document.
 *
 * @throws std::invalid_argument if @p part is null
 */
ParametricPart makeParametric(std::shared_ptr<Part> part);

} // namespace partcad::core::part

#endif // PARTCAD_CORE_PART_PARAMETRICPART_H
