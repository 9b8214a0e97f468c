//! # jemit Tool Driver
//!
//! Reads `id<TAB>title` lines and writes them as a JSON array of references.
//! The document is built in memory and only written out once it is complete,
//! so a failed run never leaves a truncated file behind.

#include "driver.hpp"

#include "log/log.hpp"
#include "options.hpp"

#include <charconv>
#include <fstream>
#include <iostream>

namespace jemit::cli {

Result<model::LongReference, std::string> parse_reference_line(std::string_view line) {
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }

    auto tab = line.find('\t');
    std::string_view id_text = line.substr(0, tab);

    int64_t id = 0;
    auto [end, ec] = std::from_chars(id_text.data(), id_text.data() + id_text.size(), id);
    if (id_text.empty() || ec != std::errc() || end != id_text.data() + id_text.size()) {
        return "invalid id '" + std::string(id_text) + "'";
    }

    if (tab == std::string_view::npos) {
        return model::LongReference(id);
    }
    return model::LongReference(id, std::string(line.substr(tab + 1)));
}

Result<std::vector<model::LongReference>, std::string> read_references(std::istream& in) {
    std::vector<model::LongReference> refs;
    std::string line;
    size_t line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        auto parsed = parse_reference_line(line);
        if (is_err(parsed)) {
            return "line " + std::to_string(line_no) + ": " + unwrap_err(parsed);
        }
        refs.push_back(std::move(unwrap(parsed)));
    }

    if (in.bad()) {
        return std::string("failed to read input");
    }
    return refs;
}

void write_references(Rc<const json::SerializerContext> context,
                      const std::vector<model::LongReference>& refs, json::OutputSink& out,
                      json::WriterOptions options) {
    json::JsonWriter writer(std::move(context), out, options);
    writer.begin_array();
    for (const auto& ref : refs) {
        writer.write_value(ref);
    }
    writer.end_array();
    writer.finish();
}

static Result<std::vector<model::LongReference>, std::string> load(const ToolOptions& options) {
    if (options.input.empty()) {
        return read_references(std::cin);
    }
    std::ifstream file(options.input);
    if (!file) {
        return "cannot open input file: " + options.input;
    }
    return read_references(file);
}

int jemit_main(int argc, char* argv[]) {
    auto parsed = parse_tool_options(argc, argv);
    if (is_err(parsed)) {
        std::cerr << "error: " << unwrap_err(parsed) << "\n";
        std::cerr << "Run 'jemit --help' for usage.\n";
        return EXIT_FAILURE_CODE;
    }
    const ToolOptions& options = unwrap(parsed);

    log::Logger::init(options.log);

    if (options.help) {
        print_usage();
        return EXIT_SUCCESS_CODE;
    }
    if (options.version) {
        print_version();
        return EXIT_SUCCESS_CODE;
    }

    auto refs = load(options);
    if (is_err(refs)) {
        JEMIT_LOG_ERROR("cli", unwrap_err(refs));
        return EXIT_FAILURE_CODE;
    }
    JEMIT_LOG_INFO("cli", "read " << unwrap(refs).size() << " reference(s)");

    Rc<const json::FieldNameEncoder> encoder;
    if (options.relaxed_keys) {
        encoder = make_rc<json::IdentifierFieldNameEncoder>();
    }
    auto context = make_rc<json::SerializerContext>(encoder);
    model::register_reference_types(*context);

    try {
        json::StringSink document;
        write_references(context, unwrap(refs), document,
                         json::WriterOptions{options.indent, options.compact});
        document.write('\n');

        if (options.output.empty()) {
            json::StreamSink out(std::cout);
            out.write(document.str());
            out.flush();
        } else {
            json::FileSink out(options.output);
            out.write(document.str());
            out.flush();
            JEMIT_LOG_INFO("cli", "wrote " << document.str().size() << " bytes to "
                                           << options.output);
        }
    } catch (const json::WriterError& e) {
        JEMIT_LOG_ERROR("cli", e.what());
        return EXIT_FAILURE_CODE;
    }

    auto stats = context->get_stats();
    JEMIT_LOG_DEBUG("cli", "resolution cache: " << stats.cached_types << " type(s), "
                                                << stats.hits << " hit(s), " << stats.misses
                                                << " miss(es)");
    return EXIT_SUCCESS_CODE;
}

} // namespace jemit::cli
