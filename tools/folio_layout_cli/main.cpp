/**
 * Folio Layout CLI Tool
 * Usage: folio-layout [options] [file.txt] or pipe text to stdin
 */

#include "folio/cursor/editor.hpp"
#include "folio/text/freetype_measurer.hpp"
#include "folio/view/doc_view.hpp"
#include "folio/core/logger.hpp"
#include <iostream>
#include <fstream>
#include <sstream>

using namespace folio;

void print_layout(const layout::DocLayout& doc) {
    std::cout << "=== Layout (" << doc.page_count() << " pages, " << doc.size() << " positions) ===\n";
    usize offset = 0;
    for (usize p = 0; p < doc.page_count(); ++p) {
        const auto& page = doc.page(p);
        std::cout << "page " << p << " [" << offset << ", " << offset + page.size() << ")\n";
        for (usize l = 0; l < page.line_count(); ++l) {
            const auto& line = page.line(l);
            std::cout << "  line " << l << " y=" << line.rect().y << " w=" << line.width()
                      << " h=" << line.height() << ":";
            for (usize w = 0; w < line.word_count(); ++w) {
                const auto& word = line.word(w);
                if (word.type() == render::LINE_BREAK_TYPE) {
                    std::cout << " [eol]";
                } else {
                    std::cout << " [" << word.text() << "]";
                }
            }
            std::cout << "\n";
            offset += line.size();
        }
    }
}

int main(int argc, char* argv[]) {
    logging::init();

    auto parsed = config::parse_args(argc, argv);
    if (parsed.is_err()) {
        std::cerr << "Error: " << parsed.error() << "\n\n" << config::usage("folio-layout");
        logging::shutdown();
        return 2;
    }
    const config::ParsedArgs& args = parsed.value();
    if (args.show_help) {
        std::cout << config::usage("folio-layout");
        logging::shutdown();
        return 0;
    }
    logging::set_level(args.config.log_level);
    if (!args.config.log_file.empty()) {
        auto file_sink = std::make_unique<FileSink>(args.config.log_file.c_str());
        if (!file_sink->is_open()) {
            std::cerr << "Error: Cannot open log file: " << args.config.log_file << "\n";
            logging::shutdown();
            return 1;
        }
        logging::add_sink(std::move(file_sink));
    }

    String input;
    std::stringstream buffer;
    if (!args.positional.empty()) {
        std::ifstream file(args.positional.front().c_str());
        if (!file) {
            std::cerr << "Error: Cannot open file: " << args.positional.front() << "\n";
            logging::shutdown();
            return 1;
        }
        buffer << file.rdbuf();
    } else {
        buffer << std::cin.rdbuf();
    }
    input = String(buffer.str());

    std::unique_ptr<text::TextMeasurer> measurer;
    if (!args.config.font_path.empty()) {
        auto loaded = text::FreeTypeMeasurer::load(args.config.font_path);
        if (loaded.is_err()) {
            std::cerr << "Error: " << loaded.error() << "\n";
            logging::shutdown();
            return 1;
        }
        measurer = std::move(loaded).value();
    } else {
        measurer = std::make_unique<text::FixedAdvanceMeasurer>(args.config.font_size * 0.5f);
    }

    auto built = model::make_document(model::split_paragraphs(input));
    if (built.is_err()) {
        std::cerr << "Error: " << built.error().describe() << "\n";
        logging::shutdown();
        return 1;
    }
    auto doc = std::move(built).value();
    doc->set_page(model::PageGeometry::from_config(args.config));

    cursor::Editor editor(std::move(doc), *measurer, args.config);
    auto ready = editor.initialize();
    if (ready.is_err()) {
        std::cerr << "Error: " << ready.error().describe() << "\n";
        logging::shutdown();
        return 1;
    }

    print_layout(editor.layout());

    view::RecordingSink sink;
    view::DocView doc_view(editor, sink);
    auto painted = doc_view.paint();
    if (painted.is_err()) {
        std::cerr << "Error: " << painted.error().describe() << "\n";
        logging::shutdown();
        return 1;
    }

    const auto& list = sink.last();
    std::cout << "\n=== Display List (" << list.size() << " commands) ===\n";
    std::cout << "pages: " << list.count<view::PaintPageCommand>()
              << ", lines: " << list.count<view::PaintLineCommand>()
              << ", words: " << list.count<view::PaintWordCommand>() << "\n";
    view::StreamSink dump(std::cout);
    dump.present(list);

    logging::shutdown();
    return 0;
}
