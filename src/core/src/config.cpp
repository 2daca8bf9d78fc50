#include "folio/core/config.hpp"
#include <charconv>

namespace folio::config {

namespace {

std::optional<f32> parse_number(std::string_view text) {
    f32 value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

Error<String> bad_value(std::string_view option, std::string_view value) {
    StringBuilder sb;
    sb.append("invalid value '").append(value).append("' for ").append(option);
    return make_error(sb.build());
}

} // namespace

Result<ParsedArgs, String> parse_args(int argc, const char* const* argv) {
    ParsedArgs parsed;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);

        if (arg == "-h" || arg == "--help") {
            parsed.show_help = true;
            continue;
        }

        if (!arg.starts_with("--")) {
            parsed.positional.emplace_back(arg);
            continue;
        }

        auto eq = arg.find('=');
        if (eq == std::string_view::npos) {
            StringBuilder sb;
            sb.append("option ").append(arg).append(" expects a value (--name=value)");
            return make_error(sb.build());
        }

        auto name = arg.substr(0, eq);
        auto value = arg.substr(eq + 1);

        if (name == "--font") {
            parsed.config.font_path = String(value);
            continue;
        }

        if (name == "--log-file") {
            parsed.config.log_file = String(value);
            continue;
        }

        if (name == "--log-level") {
            auto level = parse_log_level(value);
            if (!level) return bad_value(name, value);
            parsed.config.log_level = *level;
            continue;
        }

        auto number = parse_number(value);
        if (!number || *number < 0) {
            return bad_value(name, value);
        }

        if (name == "--page-width") {
            parsed.config.page_width = *number;
        } else if (name == "--page-height") {
            parsed.config.page_height = *number;
        } else if (name == "--padding") {
            parsed.config.set_padding(*number);
        } else if (name == "--page-gap") {
            parsed.config.page_gap = *number;
        } else if (name == "--font-size") {
            parsed.config.font_size = *number;
        } else if (name == "--line-height") {
            parsed.config.line_height = *number;
        } else {
            StringBuilder sb;
            sb.append("unknown option ").append(name);
            return make_error(sb.build());
        }
    }

    if (content_width(parsed.config) <= 0 || content_height(parsed.config) <= 0) {
        return make_error(String("page paddings leave no content area"));
    }

    return parsed;
}

String usage(std::string_view program) {
    StringBuilder sb;
    sb.append("Usage: ").append(program).append(" [options] [file]\n")
      .append("  --page-width=N    page width (default 816)\n")
      .append("  --page-height=N   page height (default 1056)\n")
      .append("  --padding=N       uniform page padding (default 40)\n")
      .append("  --page-gap=N      gap between pages (default 16)\n")
      .append("  --font=PATH       font file for FreeType measurement\n")
      .append("  --font-size=N     default font size (default 16)\n")
      .append("  --line-height=N   line height multiplier (default 1.5)\n")
      .append("  --log-level=L     trace|debug|info|warn|error|off\n")
      .append("  --log-file=PATH   also append log lines to PATH\n");
    return sb.build();
}

} // namespace folio::config
