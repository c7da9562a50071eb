#include "common/store_config.hpp"

#include <array>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <boost/program_options.hpp>
#include <spdlog/fmt/fmt.h>

namespace po = boost::program_options;

namespace recdb {

namespace {

// ── Helpers ───────────────────────────────────────────────────────────────────

struct CommandSpec {
    std::string_view name;
    std::size_t      arg_count;
    bool             mutating;
};

constexpr std::array<CommandSpec, 7> kCommands{{
    {"put",    2, true},
    {"append", 2, true},
    {"get",    1, false},
    {"del",    1, true},
    {"exists", 1, false},
    {"keys",   0, false},
    {"stats",  0, false},
}};

[[nodiscard]] const CommandSpec* find_command(std::string_view name) {
    for (const auto& spec : kCommands) {
        if (spec.name == name) {
            return &spec;
        }
    }
    return nullptr;
}

// Validate the fully populated CliConfig.
void validate(const CliConfig& cfg) {
    if (cfg.file.empty()) {
        throw std::runtime_error("--file must not be empty");
    }
    if (cfg.options.cache_capacity == 0) {
        throw std::runtime_error("--cache-size must be > 0");
    }
    if (auto ec = format::validate(cfg.options.layout)) {
        throw std::runtime_error(
            fmt::format("Invalid layout: {} (header-length={}, data-start-offset={}, "
                        "max-key-length={}, record-header-length={})",
                        ec.message(),
                        cfg.options.layout.header_length,
                        cfg.options.layout.data_start_offset,
                        cfg.options.layout.max_key_length,
                        cfg.options.layout.record_header_length));
    }

    const auto* spec = find_command(cfg.command);
    if (spec == nullptr) {
        throw std::runtime_error(fmt::format("Unknown command '{}'", cfg.command));
    }
    if (cfg.args.size() != spec->arg_count) {
        throw std::runtime_error(
            fmt::format("Command '{}' takes {} argument(s), got {}",
                        cfg.command, spec->arg_count, cfg.args.size()));
    }
    if (spec->mutating && cfg.options.read_only) {
        throw std::runtime_error(
            fmt::format("Command '{}' is not allowed with --read-only", cfg.command));
    }
}

} // anonymous namespace

// ── add_options ───────────────────────────────────────────────────────────────

void add_options(po::options_description& desc) {
    const StoreOptions defaults;

    desc.add_options()
        ("help,h",
            "Show this help message and exit")
        ("file,f",
            po::value<std::string>()->required(),
            "Path of the store file (created if missing unless --read-only)")
        ("read-only,r",
            "Open the store read-only")
        ("max-key-length",
            po::value<uint32_t>()->default_value(defaults.layout.max_key_length),
            "Bytes reserved per key in the index, including the 2-byte length")
        ("header-length",
            po::value<uint32_t>()->default_value(defaults.layout.header_length),
            "Length of the file header region")
        ("record-header-length",
            po::value<uint32_t>()->default_value(defaults.layout.record_header_length),
            "Length of the location part of an index entry")
        ("data-start-offset",
            po::value<uint32_t>()->default_value(defaults.layout.data_start_offset),
            "Offset of the data-start pointer inside the header")
        ("initial-capacity",
            po::value<uint32_t>()->default_value(defaults.initial_index_capacity),
            "Index slots reserved when a new file is created")
        ("cache-size",
            po::value<std::size_t>()->default_value(defaults.cache_capacity),
            "Read cache capacity (entries)")
        ("queue-size",
            po::value<std::size_t>()->default_value(defaults.queue_capacity),
            "Write queue capacity (entries), 0 disables the queue")
        ("log-level,l",
            po::value<std::string>()->default_value("warn"),
            "Log level: trace|debug|info|warn|error|critical|off")
        ("command",
            po::value<std::string>()->required(),
            "put|append|get|del|exists|keys|stats")
        ("args",
            po::value<std::vector<std::string>>()->default_value({}, ""),
            "Command arguments");
}

// ── parse_config ──────────────────────────────────────────────────────────────

CliConfig parse_config(int argc, char* argv[]) {
    po::options_description desc("recdb options");
    add_options(desc);

    po::positional_options_description positional;
    positional.add("command", 1);
    positional.add("args", -1);

    po::variables_map vm;
    try {
        po::store(
            po::command_line_parser(argc, argv)
                .options(desc)
                .positional(positional)
                .run(),
            vm);

        // Handle --help before notify() so missing required options don't error.
        if (vm.count("help")) {
            std::ostringstream oss;
            oss << "Usage: recdb --file PATH [options] COMMAND [ARGS...]\n" << desc;
            throw std::runtime_error(oss.str());
        }

        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error(fmt::format("Argument error: {}", e.what()));
    }

    CliConfig cfg;
    cfg.file      = vm["file"].as<std::string>();
    cfg.log_level = vm["log-level"].as<std::string>();
    cfg.command   = vm["command"].as<std::string>();
    cfg.args      = vm["args"].as<std::vector<std::string>>();

    cfg.options.read_only                   = vm.count("read-only") > 0;
    cfg.options.layout.max_key_length       = vm["max-key-length"].as<uint32_t>();
    cfg.options.layout.header_length        = vm["header-length"].as<uint32_t>();
    cfg.options.layout.record_header_length = vm["record-header-length"].as<uint32_t>();
    cfg.options.layout.data_start_offset    = vm["data-start-offset"].as<uint32_t>();
    cfg.options.initial_index_capacity      = vm["initial-capacity"].as<uint32_t>();
    cfg.options.cache_capacity              = vm["cache-size"].as<std::size_t>();
    cfg.options.queue_capacity              = vm["queue-size"].as<std::size_t>();
    cfg.options.use_queue                   = cfg.options.queue_capacity > 0;

    validate(cfg);
    return cfg;
}

} // namespace recdb
