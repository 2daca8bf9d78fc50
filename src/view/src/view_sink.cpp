#include "folio/view/view_sink.hpp"
#include <ostream>

namespace folio::view {

void StreamSink::present(const DisplayList& list) {
    for (const auto& command : list) {
        m_out << describe(command) << '\n';
    }
    m_out.flush();
}

} // namespace folio::view
