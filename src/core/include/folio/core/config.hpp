#pragma once

#include "types.hpp"
#include "string.hpp"
#include "logger.hpp"
#include <vector>

namespace folio {

// ============================================================================
// Editor Configuration
// ============================================================================

/**
 * @brief Page geometry and measurement settings shared by all layers
 */
struct EditorConfig {
    /**
     * @brief Page size in layout units (US Letter at 96 dpi by default)
     */
    f32 page_width = 816.0f;
    f32 page_height = 1056.0f;

    /**
     * @brief Page paddings; content area is the page minus these
     */
    f32 page_padding_top = 40.0f;
    f32 page_padding_bottom = 40.0f;
    f32 page_padding_left = 40.0f;
    f32 page_padding_right = 40.0f;

    // Vertical gap between stacked pages in the view
    f32 page_gap = 16.0f;

    /**
     * @brief Default font size for text runs without an explicit size
     */
    f32 font_size = 16.0f;

    /**
     * @brief Line height as a multiple of the font size
     */
    f32 line_height = 1.5f;

    /**
     * @brief Font file for FreeType measurement (empty = fixed advance)
     */
    String font_path;

    /**
     * @brief Minimum level for the global logger
     */
    LogLevel log_level = LogLevel::Info;

    // Extra log destination next to the console (empty = console only)
    String log_file;

    void set_padding(f32 padding) {
        page_padding_top = padding;
        page_padding_bottom = padding;
        page_padding_left = padding;
        page_padding_right = padding;
    }
};

namespace config {

[[nodiscard]] inline f32 content_width(const EditorConfig& cfg) {
    return cfg.page_width - cfg.page_padding_left - cfg.page_padding_right;
}

[[nodiscard]] inline f32 content_height(const EditorConfig& cfg) {
    return cfg.page_height - cfg.page_padding_top - cfg.page_padding_bottom;
}

struct ParsedArgs {
    EditorConfig config;
    std::vector<String> positional;
    bool show_help{false};
};

// Parses --page-width=, --page-height=, --padding=, --page-gap=, --font=,
// --font-size=, --line-height=, --log-level=, --log-file= and -h/--help; other
// arguments are positional.
[[nodiscard]] Result<ParsedArgs, String> parse_args(int argc, const char* const* argv);

[[nodiscard]] String usage(std::string_view program);

} // namespace config

} // namespace folio
