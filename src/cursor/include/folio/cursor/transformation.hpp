#pragma once

#include "operation.hpp"

namespace folio::cursor {

/**
 * @brief Model edits plus the resulting cursor, applied as one unit
 *
 * head and anchor are selectable offsets in the document produced by the
 * operations. A missing anchor collapses the cursor onto head.
 */
struct Transformation {
    OperationList operations;
    usize head{0};
    std::optional<usize> anchor;
    bool keep_left_lock{false};

    [[nodiscard]] static Transformation move_to(usize head, std::optional<usize> anchor = std::nullopt) {
        Transformation t;
        t.head = head;
        t.anchor = anchor;
        return t;
    }
};

} // namespace folio::cursor
