#pragma once

#include "folio/core/types.hpp"
#include "folio/core/string.hpp"
#include <vector>

namespace folio::text {

// ============================================================================
// Font Description
// ============================================================================

struct FontDescription {
    String family{"sans-serif"};
    f32 size{16.0f};
    bool bold{false};
    bool italic{false};

    [[nodiscard]] bool operator==(const FontDescription& other) const = default;
};

// ============================================================================
// Font Metrics
// ============================================================================

struct FontMetrics {
    f32 ascender{0};       // Distance from baseline to top
    f32 descender{0};      // Distance from baseline to bottom (negative)
    f32 line_gap{0};       // Extra spacing between lines

    [[nodiscard]] f32 line_height() const { return ascender - descender + line_gap; }
};

// ============================================================================
// TextMeasurer - Width measurement used by layout
// ============================================================================

class TextMeasurer {
public:
    virtual ~TextMeasurer() = default;

    /**
     * @brief Advance of every byte of text
     *
     * The first byte of a code point carries its advance (plus kerning
     * against the previous code point), continuation bytes carry 0, so
     * the prefix sum up to a byte offset is the caret x at that offset.
     */
    [[nodiscard]] virtual std::vector<f32> advances(const String& text, const FontDescription& font) const = 0;

    [[nodiscard]] virtual FontMetrics metrics(const FontDescription& font) const = 0;

    [[nodiscard]] f32 measure(const String& text, const FontDescription& font) const;
};

// ============================================================================
// FixedAdvanceMeasurer - Every code point is the same width
// ============================================================================

class FixedAdvanceMeasurer : public TextMeasurer {
public:
    explicit FixedAdvanceMeasurer(f32 advance = 1.0f) : m_advance(advance) {}

    [[nodiscard]] std::vector<f32> advances(const String& text, const FontDescription& font) const override;
    [[nodiscard]] FontMetrics metrics(const FontDescription& font) const override;

    [[nodiscard]] f32 advance() const { return m_advance; }

private:
    f32 m_advance;
};

} // namespace folio::text
