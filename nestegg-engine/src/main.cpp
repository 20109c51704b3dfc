#include <iostream>
#include <fstream>
#include <optional>
#include <string>
#include <vector>
#include "comparison.hpp"
#include "config_parser.hpp"
#include "logger.hpp"
#include "io/json_writer.hpp"
#include "io/parquet_writer.hpp"
#include "io/plan_reader.hpp"

namespace {

// Flags left unset keep the value from --config (or the built-in default)
struct CLIArgs {
    std::string plan_path;
    std::string config_path;
    std::vector<std::string> scenarios;
    bool base_only = false;
    std::string output_path;
    std::string format;
    bool detailed = false;
    bool sequential = false;
    bool continue_on_error = false;
    std::string log_level;
    std::string log_file;
    bool log_text = false;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "NestEgg Engine v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " --plan <path> [options]\n\n";
    std::cerr << "Input options:\n";
    std::cerr << "  --plan <path>               JSON plan document (household, plan, base facts, scenarios)\n";
    std::cerr << "  --config <path>             JSON engine configuration (logging, output, comparison)\n\n";
    std::cerr << "Scenario options:\n";
    std::cerr << "  --scenario <name>           Project only this scenario (repeatable, default: all)\n";
    std::cerr << "  --base-only                 Project the base case only\n";
    std::cerr << "  --sequential                Run scenarios on one thread\n";
    std::cerr << "  --continue-on-error         Flag failed scenarios instead of aborting\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --output <path>             Output file (default: JSON on stdout)\n";
    std::cerr << "  --format <json|parquet>     Output format (default: json)\n";
    std::cerr << "  --detailed                  Include totals, yearly activity and category totals\n\n";
    std::cerr << "Logging options:\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR (default: INFO)\n";
    std::cerr << "  --log-file <path>           Append log lines to a file\n";
    std::cerr << "  --log-text                  Plain text log lines instead of JSON\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Examples:\n\n";
    std::cerr << "  1. Base case and every scenario to stdout:\n";
    std::cerr << "     " << program_name << " --plan data/sample_plan.json\n\n";
    std::cerr << "  2. Two scenarios to Parquet, with a config file:\n";
    std::cerr << "     " << program_name << " --plan data/sample_plan.json \\\n";
    std::cerr << "         --config engine.json \\\n";
    std::cerr << "         --scenario \"Retire at 62\" --scenario \"Sell rental\" \\\n";
    std::cerr << "         --format parquet --output results.parquet\n";
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            return true;
        } else if (arg == "--plan" && i + 1 < argc) {
            args.plan_path = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--scenario" && i + 1 < argc) {
            args.scenarios.push_back(argv[++i]);
        } else if (arg == "--base-only") {
            args.base_only = true;
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_path = argv[++i];
        } else if (arg == "--format" && i + 1 < argc) {
            args.format = argv[++i];
        } else if (arg == "--detailed") {
            args.detailed = true;
        } else if (arg == "--sequential") {
            args.sequential = true;
        } else if (arg == "--continue-on-error") {
            args.continue_on_error = true;
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--log-file" && i + 1 < argc) {
            args.log_file = argv[++i];
        } else if (arg == "--log-text") {
            args.log_text = true;
        } else {
            std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
            return false;
        }
    }
    return true;
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    if (args.plan_path.empty() && args.config_path.empty()) {
        std::cerr << "Error: --plan is required (or a --config naming a plan)\n";
        valid = false;
    }

    if (!args.config_path.empty() && !file_exists(args.config_path)) {
        std::cerr << "Error: Config file not found: " << args.config_path << "\n";
        valid = false;
    }

    if (!args.format.empty() && args.format != "json" && args.format != "parquet") {
        std::cerr << "Error: --format must be json or parquet\n";
        valid = false;
    }

    if (args.base_only && !args.scenarios.empty()) {
        std::cerr << "Error: --base-only cannot be combined with --scenario\n";
        valid = false;
    }

    if (!args.log_level.empty()) {
        try {
            nestegg::string_to_level(args.log_level);
        } catch (const std::invalid_argument&) {
            std::cerr << "Error: --log-level must be DEBUG, INFO, WARN or ERROR\n";
            valid = false;
        }
    }

    return valid;
}

// Command-line flags take precedence over the configuration file
void apply_cli_overrides(const CLIArgs& args, nestegg::EngineConfig& config) {
    if (!args.plan_path.empty()) config.plan_path = args.plan_path;
    if (!args.output_path.empty()) config.output.path = args.output_path;
    if (!args.format.empty()) config.output.format = args.format;
    if (args.detailed) config.comparison.detailed = true;
    if (args.sequential) config.comparison.parallel = false;
    if (args.continue_on_error) config.comparison.stop_on_error = false;
    if (!args.log_level.empty()) config.logging.min_level = nestegg::string_to_level(args.log_level);
    if (!args.log_file.empty()) {
        config.logging.enable_file = true;
        config.logging.log_file_path = args.log_file;
    }
    if (args.log_text) config.logging.enable_json = false;
}

void print_summary(const nestegg::ComparisonResult& result) {
    std::cerr << "\nResults (" << result.window.start_year << "-" << result.window.end_year
              << ", retirement " << result.window.retirement_year << "):\n";
    for (const auto& series : result.series) {
        std::cerr << "  " << series.name << ": ";
        if (series.failed) {
            std::cerr << "FAILED (" << series.error << ")\n";
            continue;
        }
        const nestegg::YearlySnapshot& last = series.projection.final_year();
        std::cerr << "nest egg " << nestegg::format_money(last.nest_egg)
                  << ", net worth " << nestegg::format_money(last.net_worth)
                  << " in " << last.year << "\n";
    }
    std::cerr << "  Execution: " << result.execution_time_ms << " ms\n";
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    // Parse arguments
    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 1;
    }

    // Handle help
    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    // If no arguments provided, show usage
    if (argc == 1) {
        print_usage(argv[0]);
        return 0;
    }

    // Validate arguments
    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    }

    nestegg::Logger& logger = nestegg::Logger::get_instance();

    try {
        nestegg::EngineConfig config;
        if (!args.config_path.empty()) {
            config = nestegg::parse_engine_config_from_file(args.config_path);
        }
        apply_cli_overrides(args, config);
        nestegg::validate_engine_config(config);

        if (config.plan_path.empty()) {
            throw nestegg::ConfigParseError("No plan given: use --plan or set \"plan\" in the config");
        }
        if (!file_exists(config.plan_path)) {
            throw nestegg::ConfigParseError("Plan file not found: " + config.plan_path);
        }
        if (config.output.format == "parquet" && config.output.path.empty()) {
            throw nestegg::ConfigParseError("Parquet output requires --output <path>");
        }

        logger.configure(config.logging);

        nestegg::io::PlanDocument doc = nestegg::io::read_plan_json(config.plan_path);
        logger.log_plan_loaded(doc.plan, doc.scenarios.size(), config.plan_path);

        nestegg::ScenarioSet selected;
        if (!args.base_only) {
            selected = args.scenarios.empty() ? doc.scenarios : doc.scenarios.select(args.scenarios);
        }

        nestegg::ComparisonResult result =
            nestegg::compare_scenarios(doc.household, doc.plan, selected, config.comparison);

        print_summary(result);

        if (config.output.format == "parquet") {
            nestegg::io::ParquetWriter::write_comparison(result, config.output.path);
            std::cerr << "\nOutput written to: " << config.output.path << "\n";
        } else if (config.output.path.empty()) {
            nestegg::io::write_comparison_json(std::cout, result, config.output.pretty);
        } else {
            nestegg::io::write_comparison_json(config.output.path, result, config.output.pretty);
            std::cerr << "\nOutput written to: " << config.output.path << "\n";
        }

        logger.flush();
        return 0;
    } catch (const std::exception& e) {
        logger.log_error(e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
