#pragma once

#include "folio/core/config.hpp"
#include "log_capture.hpp"
#include "folio/model/document.hpp"

namespace folio::testing {

// Page without padding so the content area equals the page size
inline EditorConfig make_config(f32 content_width, f32 content_height = 1000.0f) {
    EditorConfig config;
    config.page_width = content_width;
    config.page_height = content_height;
    config.set_padding(0);
    config.font_size = 10.0f;
    config.line_height = 1.0f;
    config.page_gap = 0.0f;
    return config;
}

inline std::unique_ptr<model::Document> make_doc(const std::vector<String>& paragraphs,
                                                 const EditorConfig& config) {
    auto built = model::make_document(paragraphs);
    EXPECT_TRUE(built.is_ok()) << built.error().describe();
    auto doc = std::move(built).value();
    doc->set_page(model::PageGeometry::from_config(config));
    return doc;
}

} // namespace folio::testing
