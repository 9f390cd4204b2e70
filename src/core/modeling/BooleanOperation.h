#ifndef PARTCAD_CORE_MODELING_BOOLEANOPERATION_H
#define PARTCAD_CORE_MODELING_BOOLEANOPERATION_H

#include "../part/Part.h"

#include <optional>
#include <string>

namespace partcad::core::modeling {

enum class BooleanOp {
    Union,
    Difference,
    Intersection
};

/**
 * @brief Lower-case operator name used in result part names ("union", ...)
 */
const char* booleanOpName(BooleanOp op);

/**
 * @brief Parse "union", "difference" or "intersection" (case-sensitive)
 */
std::optional<BooleanOp> parseBooleanOp(const std::string& name);

class BooleanOperation {
public:
    /**
     * @brief Combines two parts into a new derived part.
     * @param a The first operand (the part cut from, for Difference).
     * @param b The second operand.
     * @param op The boolean operator.
     * @return Part named "<a>_<op>_<b>" with an empty parameter map.
     * @throws geometry::InvalidOperationError if @p op is not a known operator.
     * @throws geometry::BooleanOperationError for any failure while tessellating,
     *         running the kernel or validating the result, including an empty
     *         result such as the intersection of disjoint solids.
     */
    static part::Part combine(const part::Part& a, const part::Part& b, BooleanOp op);

    /**
     * @brief Same as above with the operator given by name.
     * @throws geometry::InvalidOperationError for an unrecognised name.
     */
    static part::Part combine(const part::Part& a, const part::Part& b, const std::string& opName);

    static part::Part unite(const part::Part& a, const part::Part& b) {
        return combine(a, b, BooleanOp::Union);
    }
    static part::Part subtract(const part::Part& a, const part::Part& b) {
        return combine(a, b, BooleanOp::Difference);
    }
    static part::Part intersect(const part::Part& a, const part::Part& b) {
        return combine(a, b, BooleanOp::Intersection);
    }
};

} // namespace partcad::core::modeling

#endif // PARTCAD_CORE_MODELING_BOOLEANOPERATION_H
