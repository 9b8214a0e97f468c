#include "options.hpp"

#include <charconv>
#include <iostream>
#include <string_view>

namespace jemit::cli {

static bool parse_indent(std::string_view text, int& out) {
    int value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || end != text.data() + text.size() || value < 0 || value > 16) {
        return false;
    }
    out = value;
    return true;
}

Result<ToolOptions, std::string> parse_tool_options(int argc, char* argv[]) {
    ToolOptions options;
    options.log = log::parse_log_options(argc, argv);

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            options.help = true;
        } else if (arg == "--version" || arg == "-V") {
            options.version = true;
        } else if (arg == "--compact") {
            options.compact = true;
        } else if (arg == "--relaxed-keys") {
            options.relaxed_keys = true;
        } else if (arg.starts_with("--indent=")) {
            if (!parse_indent(arg.substr(9), options.indent)) {
                return std::string("invalid indent '") + std::string(arg.substr(9)) +
                       "' (expected 0-16)";
            }
        } else if (arg.starts_with("--output=")) {
            options.output = std::string(arg.substr(9));
            if (options.output.empty()) {
                return std::string("--output requires a path");
            }
        } else if (log::is_log_option(arg)) {
            // Consumed by parse_log_options
        } else if (arg == "-") {
            options.input.clear();
        } else if (arg.starts_with("-")) {
            return "unknown option: " + std::string(arg);
        } else if (options.input.empty()) {
            options.input = std::string(arg);
        } else {
            return "unexpected argument: " + std::string(arg);
        }
    }

    return options;
}

void print_usage() {
    std::cout << "jemit " << VERSION << "\n\n";
    std::cout << "Usage: jemit [options] [input]\n\n";
    std::cout << "Reads id<TAB>title lines (stdin when no input is given) and\n";
    std::cout << "writes them as a JSON array of references.\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --help, -h          Show this help\n";
    std::cout << "  --version, -V       Show version\n";
    std::cout << "  --indent=N          Spaces per nesting level (default 2)\n";
    std::cout << "  --compact           Emit no whitespace\n";
    std::cout << "  --relaxed-keys      Write identifier keys without quotes\n";
    std::cout << "  --output=PATH       Write to PATH instead of stdout\n";
    std::cout << "  --log-level=LEVEL   trace, debug, info, warn, error, fatal, off\n";
    std::cout << "  --log-filter=SPEC   Per-module levels, e.g. json=trace,*=warn\n";
    std::cout << "  --log-file=PATH     Also log to PATH\n";
    std::cout << "  --log-format=FMT    text or json\n";
    std::cout << "  -v, -vv, -vvv       Info, debug, trace logging\n";
    std::cout << "  -q, --quiet         Errors only\n";
}

void print_version() {
    std::cout << "jemit " << VERSION << "\n";
}

} // namespace jemit::cli
