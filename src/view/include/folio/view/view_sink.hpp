#pragma once

#include "display_list.hpp"
#include <ostream>

namespace folio::view {

// ============================================================================
// ViewSink - Receives finished display lists
// ============================================================================

class ViewSink {
public:
    virtual ~ViewSink() = default;
    virtual void present(const DisplayList& list) = 0;
};

// Keeps the last list presented
class RecordingSink : public ViewSink {
public:
    void present(const DisplayList& list) override {
        m_last = list;
        ++m_presented;
    }

    [[nodiscard]] const DisplayList& last() const { return m_last; }
    [[nodiscard]] usize presented() const { return m_presented; }

private:
    DisplayList m_last;
    usize m_presented{0};
};

// Writes one line per command
class StreamSink : public ViewSink {
public:
    explicit StreamSink(std::ostream& out) : m_out(out) {}

    void present(const DisplayList& list) override;

private:
    std::ostream& m_out;
};

} // namespace folio::view
