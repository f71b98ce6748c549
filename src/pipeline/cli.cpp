#include <pipeline/cli.hpp>
#include <pipeline/extraction_config.hpp>
#include <pipeline/key_aggregator.hpp>
#include <schema/result_json.hpp>
#include <utils/logger.hpp>
#include <fstream>
#include <ostream>

namespace YangKeys {

CliOptions parse_arguments(const std::vector<std::string>& args) {
    CliOptions options;
    bool positional_only = false;
    bool have_archive = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (!positional_only && arg == "--") {
            positional_only = true;
        } else if (!positional_only && (arg == "-h" || arg == "--help")) {
            options.show_help = true;
        } else if (!positional_only && (arg == "-v" || arg == "--verbose")) {
            options.verbose = true;
        } else if (!positional_only && (arg == "-o" || arg == "--output")) {
            if (i + 1 >= args.size()) throw UsageError("argument " + arg + ": expected one argument");
            options.output_path = args[++i];
        } else if (!positional_only && arg.rfind("--output=", 0) == 0) {
            options.output_path = arg.substr(9);
        } else if (!positional_only && arg.size() > 2 && arg.rfind("-o", 0) == 0) {
            options.output_path = arg.substr(2);
        } else if (!positional_only && arg.size() > 1 && arg[0] == '-') {
            throw UsageError("unrecognized argument: " + arg);
        } else if (!have_archive) {
            options.archive_path = arg;
            have_archive = true;
        } else {
            throw UsageError("unrecognized argument: " + arg);
        }
    }

    if (!have_archive && !options.show_help) {
        throw UsageError("the following arguments are required: zip_file");
    }
    return options;
}

std::string usage(const std::string& program) {
    return "Usage: " + program + " [-h] [--output OUTPUT] [--verbose] zip_file\n"
           "\n"
           "Extract primary keys from YANG files in a ZIP archive.\n"
           "\n"
           "Arguments:\n"
           "  zip_file              Path to the ZIP file containing YANG files\n"
           "\n"
           "Options:\n"
           "  -h, --help            Show this help message and exit\n"
           "  -o, --output OUTPUT   Output file path (JSON format)\n"
           "  -v, --verbose         Enable verbose output\n"
           "\n"
           "Environment:\n"
           "  YANGKEYS_EXTENSION     Schema file extension (default .yang)\n"
           "  YANGKEYS_SEPARATOR     Version/name separator (default -)\n"
           "  YANGKEYS_SAMPLE_BYTES  Bytes shown from a sample file when nothing matches (default 500)\n"
           "  YANGKEYS_TMPDIR        Parent directory for scratch files\n";
}

int run_cli(const CliOptions& options, std::ostream& out) {
    if (options.verbose) {
        Logger::set_level(Logger::Level::Debug);
    }

    try {
        ExtractionConfig config = ExtractionConfig::load_from_env();
        KeyAggregator aggregator(config);
        ResultMapping primary_keys = aggregator.extract_from_archive(options.archive_path);
        std::string document = dump_mapping(primary_keys);

        if (options.output_path) {
            std::ofstream file(*options.output_path, std::ios::binary | std::ios::trunc);
            if (!file) {
                throw std::runtime_error("Could not open output file: " + *options.output_path);
            }
            file << document;
            file.close();
            if (!file) {
                throw std::runtime_error("Could not write output file: " + *options.output_path);
            }
            Logger::info("Results saved to " + *options.output_path);
        } else {
            out << document << '\n';
            out.flush();
        }
    } catch (const std::exception& e) {
        Logger::error(std::string("Error: ") + e.what());
        return 1;
    }

    return 0;
}

} // namespace YangKeys
