#include "cli_common.hpp"
#include <common/logging.hpp>
#include <compare/comparison.hpp>
#include <io/csv_reader.hpp>
#include <io/csv_report_writer.hpp>
#include <serialization/comparison_json.hpp>
#include <serialization/config_json.hpp>
#include <serialization/json_serialization.hpp>
#include <filesystem>
#include <iostream>

namespace funnel::cli {

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [OPTIONS...]\n";
    std::cerr << "  Compares time series within user-specified tolerances.\n";
    std::cerr << "\n";
    std::cerr << "Options:\n";
    std::cerr << "  -t, --test <file>       CSV file to be tested\n";
    std::cerr << "  -r, --reference <file>  CSV file with reference data\n";
    std::cerr << "  -o, --output <dir>      Directory to save outputs\n";
    std::cerr << "  --atolx <value>         Absolute tolerance in x direction\n";
    std::cerr << "  --atoly <value>         Absolute tolerance in y direction\n";
    std::cerr << "  --rtolx <value>         Relative tolerance in x direction\n";
    std::cerr << "  --rtoly <value>         Relative tolerance in y direction\n";
    std::cerr << "  -c, --config <file>     JSON file with tolerances and CSV options\n";
    std::cerr << "  --skip-lines <n>        Header lines to skip in the CSV files (default 1)\n";
    std::cerr << "  --summary               Also write summary.json to the output directory\n";
    std::cerr << "  -v, --verbose           Debug logging\n";
    std::cerr << "  --log-level <name>      Log threshold (trace, debug, info, warn, error, off)\n";
    std::cerr << "  -h, --help              Show this help message\n";
    std::cerr << "\n";
    std::cerr << "At least one tolerance must be specified for x and y.\n";
    std::cerr << "Command-line tolerances override the config file.\n";
    std::cerr << "\n";
    std::cerr << "Typical use:\n";
    std::cerr << "  " << program_name
              << " --reference trended.csv --test simulated.csv"
                 " --atolx 0.002 --atoly 0.002 --output results/\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  FUNNEL_LOG_LEVEL - Set log level (trace, debug, info, warn, error, off)\n";
}

int command_compare(int argc, char** argv) {
    auto log = funnel::logging::get_logger();

    try {
        CommandContext ctx = parse_args(argc, argv, 1);

        if (ctx.help) {
            print_usage(argv[0]);
            return 0;
        }
        if (ctx.verbose) {
            funnel::logging::enable_verbose();
        }
        if (ctx.log_level && !funnel::logging::set_level(*ctx.log_level)) {
            throw ConfigurationError("Unknown log level '" + *ctx.log_level + "'");
        }

        if (ctx.test_path.empty() || ctx.reference_path.empty() || ctx.output_path.empty()) {
            print_usage(argv[0]);
            return 1;
        }

        // 1. Configuration
        RunConfig config;
        if (ctx.config_path.has_value()) {
            config = load_run_config(ctx.config_path.value());
            log->info("Loaded configuration from: {}", ctx.config_path.value());
        }
        config = apply_overrides(config, ctx);

        // 2. Read curves
        log->info("Reference: {}", ctx.reference_path);
        log->info("Test: {}", ctx.test_path);
        DataSet reference = io::read_csv(ctx.reference_path, config.csv);
        DataSet test = io::read_csv(ctx.test_path, config.csv);
        log->debug("Read {} reference and {} test samples", reference.size(), test.size());

        // 3. Compare and write the CSV report
        ComparisonResult result = compare_curves(reference, test, config.tolerances);
        io::CsvReportWriter writer(ctx.output_path);
        writer.write(result);

        // 4. Optional summary
        if (ctx.write_summary) {
            json::SerializedData summary = make_summary(result, config);
            summary.reference_file = ctx.reference_path;
            summary.test_file = ctx.test_path;
            std::filesystem::path summary_path =
                std::filesystem::path(ctx.output_path) / SUMMARY_FILE;
            json::write_json_file(summary_path.string(), summary.to_json());
            log->debug("Wrote {}", summary_path.string());
        }

        if (result.passed()) {
            log->info("Test curve is inside the tube ({} samples compared)",
                      result.errors.diff.size());
        } else {
            auto worst = result.errors.max_deviation();
            log->warn("Test curve leaves the tube at {} samples, maximum error {:.3e} at x = {}",
                      result.errors.outliers.size(), worst->y, worst->x);
        }
        std::cerr << "Wrote " << ctx.output_path << " ("
                  << result.errors.outliers.size() << " outliers in "
                  << result.errors.diff.size() << " samples)\n";

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace funnel::cli
