#pragma once

#include "measurer.hpp"
#include <memory>

#include <ft2build.h>
#include FT_FREETYPE_H

namespace folio::text {

// ============================================================================
// FreeTypeMeasurer - Glyph advances from a font file
// ============================================================================

class FreeTypeMeasurer : public TextMeasurer {
public:
    ~FreeTypeMeasurer() override;

    FreeTypeMeasurer(const FreeTypeMeasurer&) = delete;
    FreeTypeMeasurer& operator=(const FreeTypeMeasurer&) = delete;

    [[nodiscard]] static Result<std::unique_ptr<FreeTypeMeasurer>, String> load(const String& path);

    [[nodiscard]] std::vector<f32> advances(const String& text, const FontDescription& font) const override;
    [[nodiscard]] FontMetrics metrics(const FontDescription& font) const override;

    [[nodiscard]] const String& family() const { return m_family; }

private:
    FreeTypeMeasurer(FT_Library library, FT_Face face);

    void select_size(f32 size) const;
    [[nodiscard]] f32 glyph_advance(FT_UInt glyph_index) const;

    FT_Library m_library{nullptr};
    FT_Face m_face{nullptr};
    String m_family;
    mutable f32 m_current_size{0};
};

// Common TrueType locations on Linux
[[nodiscard]] std::vector<String> system_font_candidates();

// First loadable candidate, if any
[[nodiscard]] std::unique_ptr<FreeTypeMeasurer> load_system_font();

} // namespace folio::text
