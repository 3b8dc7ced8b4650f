#ifndef FUNNEL_CLI_COMMON_HPP
#define FUNNEL_CLI_COMMON_HPP

#include <common/errors.hpp>
#include <compare/run_config.hpp>
#include <cstddef>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>

namespace funnel::cli {

// Everything given on the command line
struct CommandContext {
    std::string test_path;
    std::string reference_path;
    std::string output_path;
    std::optional<std::string> config_path;

    // Explicit values; they override the config file
    std::optional<double> atolx;
    std::optional<double> atoly;
    std::optional<double> rtolx;
    std::optional<double> rtoly;
    std::optional<size_t> skip_lines;
    std::optional<std::string> log_level;

    bool write_summary = false;
    bool verbose = false;
    bool help = false;
};

// Parse a numeric option value; throws ConfigurationError on garbage
inline double parse_number(const std::string& flag, const std::string& text) {
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (text.empty() || end != text.c_str() + text.size()) {
        throw ConfigurationError(flag + " expects a number, got '" + text + "'");
    }
    return value;
}

inline size_t parse_count(const std::string& flag, const std::string& text) {
    char* end = nullptr;
    long value = std::strtol(text.c_str(), &end, 10);
    if (text.empty() || end != text.c_str() + text.size() || value < 0) {
        throw ConfigurationError(flag + " expects a non-negative integer, got '" + text + "'");
    }
    return static_cast<size_t>(value);
}

// Parse arguments starting at start_idx.
// Long options may also be written with a single dash (-atolx 0.1).
inline CommandContext parse_args(int argc, char** argv, int start_idx = 1) {
    CommandContext ctx;
    int i = start_idx;

    // Value of the option at argv[i]; advances past it
    auto take_value = [&](const std::string& flag) -> std::string {
        if (i + 1 < argc) {
            i += 2;
            return argv[i - 1];
        }
        throw std::runtime_error(flag + " requires an argument");
    };

    while (i < argc) {
        std::string arg = argv[i];
        if (arg.size() > 2 && arg[0] == '-' && arg[1] != '-') {
            arg = "-" + arg;
        }

        if (arg == "-t" || arg == "--test") {
            ctx.test_path = take_value(arg);
        } else if (arg == "-r" || arg == "--reference") {
            ctx.reference_path = take_value(arg);
        } else if (arg == "-o" || arg == "--output") {
            ctx.output_path = take_value(arg);
        } else if (arg == "-c" || arg == "--config") {
            ctx.config_path = take_value(arg);
        } else if (arg == "--atolx") {
            ctx.atolx = parse_number(arg, take_value(arg));
        } else if (arg == "--atoly") {
            ctx.atoly = parse_number(arg, take_value(arg));
        } else if (arg == "--rtolx") {
            ctx.rtolx = parse_number(arg, take_value(arg));
        } else if (arg == "--rtoly") {
            ctx.rtoly = parse_number(arg, take_value(arg));
        } else if (arg == "--skip-lines") {
            ctx.skip_lines = parse_count(arg, take_value(arg));
        } else if (arg == "--log-level") {
            ctx.log_level = take_value(arg);
        } else if (arg == "--summary") {
            ctx.write_summary = true;
            ++i;
        } else if (arg == "-v" || arg == "--verbose") {
            ctx.verbose = true;
            ++i;
        } else if (arg == "-h" || arg == "--help") {
            ctx.help = true;
            ++i;
        } else {
            throw std::runtime_error("Unknown option: " + std::string(argv[i]));
        }
    }

    return ctx;
}

// Config file values with the command-line overrides applied
inline RunConfig apply_overrides(RunConfig config, const CommandContext& ctx) {
    if (ctx.atolx) config.tolerances.atolx = *ctx.atolx;
    if (ctx.atoly) config.tolerances.atoly = *ctx.atoly;
    if (ctx.rtolx) config.tolerances.rtolx = *ctx.rtolx;
    if (ctx.rtoly) config.tolerances.rtoly = *ctx.rtoly;
    if (ctx.skip_lines) config.csv.skip_lines = *ctx.skip_lines;
    return config;
}

// Run the comparison command; returns the process exit code
int command_compare(int argc, char** argv);

void print_usage(const char* program_name);

}  // namespace funnel::cli

#endif // FUNNEL_CLI_COMMON_HPP
