#include "folio/cursor/cursor.hpp"

namespace folio::cursor {

const Cursor& CursorService::acquire_focus(usize offset) {
    if (!m_cursor) {
        m_cursor = Cursor{offset, offset, 0};
    }
    return *m_cursor;
}

} // namespace folio::cursor
