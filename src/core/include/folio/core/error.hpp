#pragma once

#include "types.hpp"
#include "string.hpp"

namespace folio {

// ============================================================================
// Editor errors
// ============================================================================

enum class ErrorKind {
    OutOfRange,           // Offset outside the valid span of a tree or subtree
    UnregisteredType,     // Type tag missing from a registry
    StructuralViolation,  // Tree invariant breached (e.g. deleting a non-child)
    InvalidArgument,      // Malformed operation parameters
};

[[nodiscard]] constexpr const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::OutOfRange: return "OutOfRange";
        case ErrorKind::UnregisteredType: return "UnregisteredType";
        case ErrorKind::StructuralViolation: return "StructuralViolation";
        case ErrorKind::InvalidArgument: return "InvalidArgument";
    }
    return "Unknown";
}

struct EditorError {
    ErrorKind kind;
    String message;

    [[nodiscard]] String describe() const;
};

template<typename T>
using EditorResult = Result<T, EditorError>;

[[nodiscard]] Error<EditorError> out_of_range(String message);
[[nodiscard]] Error<EditorError> unregistered_type(String message);
[[nodiscard]] Error<EditorError> structural_violation(String message);
[[nodiscard]] Error<EditorError> invalid_argument(String message);

} // namespace folio
