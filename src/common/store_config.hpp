#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include "format/layout.hpp"

namespace recdb {

// ── StoreOptions ─────────────────────────────────────────────────────────────
// Construction parameters for one store file.  The layout is fixed for the
// life of the file and must match between create and every later open.

struct StoreOptions {
    format::Layout layout;
    uint32_t    initial_index_capacity = 16;  // index slots reserved on create
    std::size_t cache_capacity         = 10;  // ReadCache entries, must be > 0
    bool        use_queue              = false;
    std::size_t queue_capacity         = 0;   // WriteQueue entries, must be > 0 if used
    bool        read_only              = false;
};

// ── CliConfig ─────────────────────────────────────────────────────────────────
// Configuration for one invocation of the recdb command-line tool.
// Populated by parse_config() from CLI arguments.

struct CliConfig {
    std::string              file;       // Store file path
    StoreOptions             options;
    std::string              log_level;  // spdlog level string
    std::string              command;    // put|append|get|del|exists|keys|stats
    std::vector<std::string> args;       // Positional arguments after the command
};

// ── parse_config ──────────────────────────────────────────────────────────────
// Parse CLI arguments into a CliConfig.
//
// On success: returns a fully validated CliConfig.
// On error  : throws std::runtime_error with a human-readable message
//             (--help also throws, carrying the help text).
//
// Validates:
//   - --file is not empty
//   - --cache-size > 0
//   - the layout options form a valid format::Layout
//   - the command is known and has the right number of arguments
//   - mutating commands are not combined with --read-only

[[nodiscard]] CliConfig parse_config(int argc, char* argv[]);

// ── add_options ───────────────────────────────────────────────────────────────
// Populate a boost::program_options::options_description with recdb options.
// Exposed for testing and help-text generation.

void add_options(boost::program_options::options_description& desc);

} // namespace recdb
