#include "folio/text/freetype_measurer.hpp"
#include "folio/core/logger.hpp"
#include <cmath>
#include <filesystem>

namespace folio::text {

Result<std::unique_ptr<FreeTypeMeasurer>, String> FreeTypeMeasurer::load(const String& path) {
    FT_Library library = nullptr;
    if (FT_Init_FreeType(&library)) {
        return make_error(String("failed to initialize FreeType"));
    }

    FT_Face face = nullptr;
    if (FT_New_Face(library, path.c_str(), 0, &face)) {
        FT_Done_FreeType(library);
        return make_error(String("failed to load font: ") + path);
    }

    std::unique_ptr<FreeTypeMeasurer> measurer(new FreeTypeMeasurer(library, face));
    StringBuilder sb;
    sb.append("loaded font ").append(measurer->family()).append(" from ").append(path);
    logging::get("text").info(sb.view());
    return std::move(measurer);
}

FreeTypeMeasurer::FreeTypeMeasurer(FT_Library library, FT_Face face)
    : m_library(library)
    , m_face(face)
    , m_family(face->family_name ? String(face->family_name) : String("unknown")) {}

FreeTypeMeasurer::~FreeTypeMeasurer() {
    if (m_face) {
        FT_Done_Face(m_face);
    }
    if (m_library) {
        FT_Done_FreeType(m_library);
    }
}

void FreeTypeMeasurer::select_size(f32 size) const {
    if (size == m_current_size) {
        return;
    }
    FT_Set_Pixel_Sizes(m_face, 0, static_cast<FT_UInt>(std::lround(size)));
    m_current_size = size;
}

f32 FreeTypeMeasurer::glyph_advance(FT_UInt glyph_index) const {
    if (FT_Load_Glyph(m_face, glyph_index, FT_LOAD_DEFAULT)) {
        return 0.0f;
    }
    return static_cast<f32>(m_face->glyph->advance.x) / 64.0f;
}

std::vector<f32> FreeTypeMeasurer::advances(const String& text, const FontDescription& font) const {
    select_size(font.size);

    std::vector<f32> result(text.size(), 0.0f);
    FT_UInt previous = 0;
    usize i = 0;
    while (i < text.size()) {
        auto decoded = unicode::utf8_decode(text.view().substr(i));

        FT_UInt glyph_index = FT_Get_Char_Index(m_face, decoded.code_point);
        f32 advance = glyph_advance(glyph_index);
        if (previous != 0 && glyph_index != 0 && FT_HAS_KERNING(m_face)) {
            FT_Vector kerning;
            if (!FT_Get_Kerning(m_face, previous, glyph_index, FT_KERNING_DEFAULT, &kerning)) {
                advance += static_cast<f32>(kerning.x) / 64.0f;
            }
        }

        result[i] = advance;
        previous = glyph_index;
        i += decoded.length;
    }
    return result;
}

FontMetrics FreeTypeMeasurer::metrics(const FontDescription& font) const {
    select_size(font.size);
    const auto& size_metrics = m_face->size->metrics;
    FontMetrics metrics;
    metrics.ascender = static_cast<f32>(size_metrics.ascender) / 64.0f;
    metrics.descender = static_cast<f32>(size_metrics.descender) / 64.0f;
    metrics.line_gap = static_cast<f32>(size_metrics.height - size_metrics.ascender + size_metrics.descender) / 64.0f;
    return metrics;
}

std::vector<String> system_font_candidates() {
    return {
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/TTF/DejaVuSans.ttf",
        "/usr/share/fonts/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
        "/usr/share/fonts/truetype/freefont/FreeSans.ttf",
    };
}

std::unique_ptr<FreeTypeMeasurer> load_system_font() {
    for (const auto& path : system_font_candidates()) {
        std::error_code ec;
        if (!std::filesystem::exists(path.c_str(), ec)) {
            continue;
        }
        auto loaded = FreeTypeMeasurer::load(path);
        if (loaded.is_ok()) {
            return std::move(loaded).value();
        }
        logging::get("text").warn(loaded.error().view());
    }
    return nullptr;
}

} // namespace folio::text
