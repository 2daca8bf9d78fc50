#pragma once

#include "folio/core/types.hpp"
#include <algorithm>
#include <optional>

namespace folio::cursor {

// ============================================================================
// Cursor - Anchor/head selection in selectable offsets
// ============================================================================

struct Cursor {
    usize anchor{0};
    usize head{0};
    // Preferred line-relative x for vertical moves
    f32 left_lock{0};

    [[nodiscard]] bool is_collapsed() const { return anchor == head; }
    [[nodiscard]] usize from() const { return std::min(anchor, head); }
    [[nodiscard]] usize to() const { return std::max(anchor, head); }
    [[nodiscard]] bool is_backward() const { return head < anchor; }

    [[nodiscard]] bool operator==(const Cursor& other) const = default;
};

// ============================================================================
// CursorService - Focus state
// ============================================================================

class CursorService {
public:
    // Creates a collapsed cursor at offset unless one is already active
    const Cursor& acquire_focus(usize offset = 0);
    void release_focus() { m_cursor.reset(); }

    [[nodiscard]] bool has_focus() const { return m_cursor.has_value(); }
    [[nodiscard]] const std::optional<Cursor>& cursor() const { return m_cursor; }

    void set(const Cursor& cursor) { m_cursor = cursor; }

private:
    std::optional<Cursor> m_cursor;
};

} // namespace folio::cursor
