#include "folio/text/measurer.hpp"
#include <numeric>

namespace folio::text {

f32 TextMeasurer::measure(const String& text, const FontDescription& font) const {
    auto widths = advances(text, font);
    return std::accumulate(widths.begin(), widths.end(), 0.0f);
}

std::vector<f32> FixedAdvanceMeasurer::advances(const String& text, const FontDescription&) const {
    std::vector<f32> result(text.size(), 0.0f);
    usize i = 0;
    while (i < text.size()) {
        result[i] = m_advance;
        usize length = unicode::utf8_code_point_length(text[i]);
        i += length == 0 ? 1 : length;
    }
    return result;
}

FontMetrics FixedAdvanceMeasurer::metrics(const FontDescription& font) const {
    return FontMetrics{font.size * 0.8f, -font.size * 0.2f, 0.0f};
}

} // namespace folio::text
