#include <pipeline/cli.hpp>
#include <iostream>
#include <string>
#include <vector>

using namespace YangKeys;

int main(int argc, char** argv) {
    std::string program = argc > 0 ? argv[0] : "extract_primary_keys";
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

    CliOptions options;
    try {
        options = parse_arguments(args);
    } catch (const UsageError& e) {
        std::cerr << usage(program) << "\n" << program << ": error: " << e.what() << "\n";
        return 2;
    }

    if (options.show_help) {
        std::cout << usage(program);
        return 0;
    }

    return run_cli(options, std::cout);
}
