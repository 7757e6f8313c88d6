#include <chrono>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include "parameter.hpp"
#include "inflation.hpp"
#include "eligibility.hpp"
#include "projector.hpp"
#include "logger.hpp"
#include "run_config.hpp"
#include "io/policy_reader.hpp"
#include "io/snapshot_writer.hpp"
#include "io/json_writer.hpp"

namespace {

struct CLIArgs {
    std::string config_path;
    std::string policy_path;
    std::string growfactors_path;
    std::string index_column;
    std::optional<int> prior_year;
    std::optional<int> base_year;
    std::optional<int> final_year;
    std::vector<std::string> skip;
    std::string old_path;
    std::string new_path;
    std::string json_path;
    bool abort_on_invalid = false;
    std::string log_level;
    std::optional<bool> log_json;
    std::string log_file;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "taxparam Engine v1.0.0\n\n";
    std::cerr << "Projects inflation-indexed policy parameters from the base year through\n";
    std::cerr << "the final (reversion) year and writes before/after snapshots.\n\n";
    std::cerr << "Usage: " << program_name << " [options]\n\n";
    std::cerr << "Input options:\n";
    std::cerr << "  --config <path>             JSON run configuration\n";
    std::cerr << "  --policy <path>             Parameter table JSON\n";
    std::cerr << "  --growfactors <path>        Growth factor CSV with inflation index\n";
    std::cerr << "                              (default: inflation_rates in the policy file)\n";
    std::cerr << "  --index-column <name>       Growth factor column to use (default: ACPIU)\n\n";
    std::cerr << "Year options:\n";
    std::cerr << "  --prior-year <year>         Year before the reform regime (default: 2017)\n";
    std::cerr << "  --base-year <year>          Last year with known values (default: 2019)\n";
    std::cerr << "  --final-year <year>         Reversion year (default: 2026)\n\n";
    std::cerr << "Selection options:\n";
    std::cerr << "  --skip <name>               Never project this parameter (repeatable;\n";
    std::cerr << "                              default skip list: _II_brk7 _PT_brk7)\n";
    std::cerr << "  --abort-on-invalid          Fail the run on an unusable parameter\n";
    std::cerr << "                              (default: skip it with a warning)\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --old <path>                Historical snapshot (default: ppp.old)\n";
    std::cerr << "  --new <path>                Projected snapshot (default: ppp.new)\n";
    std::cerr << "  --json <path>               JSON parameter update (default: not written)\n\n";
    std::cerr << "Logging options:\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR (default: INFO)\n";
    std::cerr << "  --log-json                  JSON log lines (default)\n";
    std::cerr << "  --log-text                  Plain text log lines\n";
    std::cerr << "  --log-file <path>           Also append log lines to a file\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Example:\n";
    std::cerr << "  " << program_name << " --policy data/policy_current_law.json \\\n";
    std::cerr << "      --growfactors data/growfactors.csv \\\n";
    std::cerr << "      --old ppp.old --new ppp.new --json ppp.json\n";
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

bool parse_int(const std::string& text, int& out) {
    try {
        size_t consumed = 0;
        out = std::stoi(text, &consumed);
        return consumed == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        int year = 0;

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            return true;
        } else if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--policy" && i + 1 < argc) {
            args.policy_path = argv[++i];
        } else if (arg == "--growfactors" && i + 1 < argc) {
            args.growfactors_path = argv[++i];
        } else if (arg == "--index-column" && i + 1 < argc) {
            args.index_column = argv[++i];
        } else if ((arg == "--prior-year" || arg == "--base-year" || arg == "--final-year") &&
                   i + 1 < argc) {
            if (!parse_int(argv[++i], year)) {
                std::cerr << "Error: " << arg << " expects a year, got: " << argv[i] << "\n\n";
                return false;
            }
            if (arg == "--prior-year") args.prior_year = year;
            else if (arg == "--base-year") args.base_year = year;
            else args.final_year = year;
        } else if (arg == "--skip" && i + 1 < argc) {
            args.skip.push_back(argv[++i]);
        } else if (arg == "--old" && i + 1 < argc) {
            args.old_path = argv[++i];
        } else if (arg == "--new" && i + 1 < argc) {
            args.new_path = argv[++i];
        } else if (arg == "--json" && i + 1 < argc) {
            args.json_path = argv[++i];
        } else if (arg == "--abort-on-invalid") {
            args.abort_on_invalid = true;
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--log-json") {
            args.log_json = true;
        } else if (arg == "--log-text") {
            args.log_json = false;
        } else if (arg == "--log-file" && i + 1 < argc) {
            args.log_file = argv[++i];
        } else {
            std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
            return false;
        }
    }
    return true;
}

// CLI flags win over the config file
void apply_overrides(const CLIArgs& args, taxparam::RunConfig& config) {
    if (!args.policy_path.empty()) config.policy_path = args.policy_path;
    if (!args.growfactors_path.empty()) config.growfactors_path = args.growfactors_path;
    if (!args.index_column.empty()) config.index_column = args.index_column;
    if (args.prior_year) config.prior_year = *args.prior_year;
    if (args.base_year) config.base_year = *args.base_year;
    if (args.final_year) config.final_year = *args.final_year;
    for (const auto& name : args.skip) config.skip.insert(name);
    if (!args.old_path.empty()) config.old_path = args.old_path;
    if (!args.new_path.empty()) config.new_path = args.new_path;
    if (!args.json_path.empty()) config.json_path = args.json_path;
    if (args.abort_on_invalid) config.on_invalid = taxparam::InvalidParameterPolicy::Abort;
    if (!args.log_level.empty()) config.logging.min_level = taxparam::string_to_level(args.log_level);
    if (args.log_json) config.logging.enable_json = *args.log_json;
    if (!args.log_file.empty()) {
        config.logging.enable_file = true;
        config.logging.log_file_path = args.log_file;
    }
}

bool validate_config(const taxparam::RunConfig& config) {
    bool valid = true;

    if (config.policy_path.empty()) {
        std::cerr << "Error: --policy is required (or set \"policy\" in --config)\n";
        valid = false;
    } else if (!file_exists(config.policy_path)) {
        std::cerr << "Error: Policy file not found: " << config.policy_path << "\n";
        valid = false;
    }

    if (!config.growfactors_path.empty() && !file_exists(config.growfactors_path)) {
        std::cerr << "Error: Growth factor file not found: " << config.growfactors_path << "\n";
        valid = false;
    }

    if (config.old_path.empty() || config.new_path.empty()) {
        std::cerr << "Error: --old and --new must not be empty\n";
        valid = false;
    }

    return valid;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 1;
    }

    if (args.help || argc == 1) {
        print_usage(argv[0]);
        return 0;
    }

    taxparam::Logger& logger = taxparam::Logger::get_instance();
    taxparam::RunContext ctx("ppp", "load");

    try {
        taxparam::RunConfig config;
        if (!args.config_path.empty()) {
            if (!file_exists(args.config_path)) {
                std::cerr << "Error: Config file not found: " << args.config_path << "\n";
                return 1;
            }
            config = taxparam::parse_run_config_from_file(args.config_path);
        }
        apply_overrides(args, config);

        if (!validate_config(config)) {
            std::cerr << "\nUse --help for usage information.\n";
            return 1;
        }

        logger.configure(config.logging);
        auto start_time = std::chrono::high_resolution_clock::now();

        // Fails here, before anything is written, if the years are out of order
        const taxparam::YearWindow window = config.window();

        logger.log_run_start(ctx, window, {
            {"policy", config.policy_path},
            {"growfactors", config.growfactors_path.empty() ? "policy file" : config.growfactors_path},
            {"on_invalid", taxparam::policy_to_string(config.on_invalid)}
        });

        taxparam::io::PolicyDocument doc = taxparam::io::read_policy_json(config.policy_path);
        logger.log_table_loaded(ctx, config.policy_path, doc.table.size(), doc.table.start_year());

        taxparam::InflationRateSeries rates;
        if (!config.growfactors_path.empty()) {
            rates = taxparam::InflationRateSeries::load_from_csv(config.growfactors_path,
                                                                 config.index_column);
            logger.log_rates_loaded(ctx, config.growfactors_path, rates);
        } else if (doc.has_rates) {
            rates = doc.rates;
            logger.log_rates_loaded(ctx, config.policy_path, rates);
        } else {
            throw taxparam::ConfigurationError(
                "No inflation rates: pass --growfactors or add inflation_rates to the policy file");
        }

        ctx.phase = "select";
        std::vector<std::string> names =
            taxparam::select_reverting_parameters(doc.table, window.final_year, config.skip);
        logger.log_parameters_selected(ctx, names.size(), config.skip.size(), doc.table.size());
        std::cout << "number_of_reverting_parameters= " << names.size() << "\n";

        ctx.phase = "project";
        taxparam::ProjectionConfig proj_config;
        proj_config.on_invalid = config.on_invalid;
        proj_config.run_id = ctx.run_id;
        taxparam::ProjectionReport report =
            taxparam::project_parameters(doc.table, names, window, rates, proj_config);

        // Both snapshots list the same parameters so they can be diffed
        ctx.phase = "write";
        std::vector<std::string> projected_names;
        projected_names.reserve(report.results.size());
        for (const auto& result : report.results) {
            projected_names.push_back(result.name);
        }
        taxparam::io::write_history_snapshot(config.old_path, doc.table, projected_names, window);
        logger.log_snapshot_written(ctx, config.old_path, projected_names.size());

        taxparam::io::write_projected_snapshot(config.new_path, report.results, window);
        logger.log_snapshot_written(ctx, config.new_path, report.results.size());

        if (!config.json_path.empty()) {
            taxparam::io::write_projection_json(config.json_path, report, window);
            logger.log_snapshot_written(ctx, config.json_path, report.results.size());
        }

        auto end_time = std::chrono::high_resolution_clock::now();
        double elapsed_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();
        logger.log_run_complete(ctx, report.results.size(), report.skipped.size(), elapsed_ms);
        logger.flush();

        return 0;
    } catch (const std::exception& e) {
        logger.log_error(ctx, e.what());
        std::cerr << "Error: " << e.what() << "\n";
        logger.flush();
        return 1;
    }
}
