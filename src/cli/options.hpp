#pragma once

#include "common.hpp"
#include "log/log.hpp"

#include <string>

namespace jemit::cli {

// Exit codes
constexpr int EXIT_SUCCESS_CODE = 0;
constexpr int EXIT_FAILURE_CODE = 1;

/// Settings for one run of the `jemit` tool.
struct ToolOptions {
    int indent = 2;            // Spaces per nesting level
    bool compact = false;      // No whitespace at all
    bool relaxed_keys = false; // Bare identifier property names
    std::string input;         // Empty = stdin
    std::string output;        // Empty = stdout
    bool help = false;
    bool version = false;
    log::LogConfig log;
};

/// Parses the tool's command line. Logging options are handed to
/// `log::parse_log_options`; anything else unknown is an error.
Result<ToolOptions, std::string> parse_tool_options(int argc, char* argv[]);

void print_usage();
void print_version();

} // namespace jemit::cli
