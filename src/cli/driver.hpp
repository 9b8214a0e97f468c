#pragma once

#include "common.hpp"
#include "json/json_writer.hpp"
#include "model/reference.hpp"

#include <istream>
#include <string>
#include <string_view>
#include <vector>

namespace jemit::cli {

/// Parses one `id<TAB>title` line. The title is optional; without it the
/// reference is titled with its id.
Result<model::LongReference, std::string> parse_reference_line(std::string_view line);

/// Reads every non-blank line of `in`. Errors name the 1-based line number.
Result<std::vector<model::LongReference>, std::string> read_references(std::istream& in);

/// Writes `refs` as one JSON array document and finishes the session.
void write_references(Rc<const json::SerializerContext> context,
                      const std::vector<model::LongReference>& refs, json::OutputSink& out,
                      json::WriterOptions options);

/// Entry point of the `jemit` tool.
int jemit_main(int argc, char* argv[]);

} // namespace jemit::cli
