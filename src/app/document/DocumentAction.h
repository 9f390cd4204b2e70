/**
 * @file DocumentAction.h
 * @brief Records kept in a document's undo/redo history.
 */
#ifndef PARTCAD_APP_DOCUMENT_DOCUMENTACTION_H
#define PARTCAD_APP_DOCUMENT_DOCUMENTACTION_H

#include "../../core/part/Part.h"

#include <memory>
#include <variant>

namespace partcad::app {

// ─────────────────────────────────────────────────────────────────────────────
// Action Types
// ─────────────────────────────────────────────────────────────────────────────

enum class ActionType {
    Add
};

struct AddPartAction {
    std::shared_ptr<core::part::Part> part;
};

// ─────────────────────────────────────────────────────────────────────────────
// Action Variant (single history entry)
// ─────────────────────────────────────────────────────────────────────────────

using DocumentAction = std::variant<
    AddPartAction
>;

// ─────────────────────────────────────────────────────────────────────────────
// Utility Functions
// ─────────────────────────────────────────────────────────────────────────────

// Variant alternatives are declared in ActionType order.
inline ActionType actionType(const DocumentAction& action) {
    return static_cast<ActionType>(action.index());
}

inline const char* actionTypeName(ActionType type) {
    switch (type) {
        case ActionType::Add: return "Add";
        default: return "Unknown";
    }
}

/**
 * @brief Part an action applies to (null if the action has none)
 */
inline std::shared_ptr<core::part::Part> actionPart(const DocumentAction& action) {
    return std::visit([](const auto& a) { return a.part; }, action);
}

} // namespace partcad::app

#endif // PARTCAD_APP_DOCUMENT_DOCUMENTACTION_H
