#pragma once

#include <export.hpp>
#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace YangKeys {

/**
 * @brief Command line of extract_primary_keys
 */
struct CliOptions {
    std::string archive_path;
    std::optional<std::string> output_path;
    bool verbose = false;
    bool show_help = false;
};

class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Parse arguments (without the program name).
 * @throws UsageError on unknown options, a missing archive path or a missing option value
 */
YANGKEYS_API CliOptions parse_arguments(const std::vector<std::string>& args);

YANGKEYS_API std::string usage(const std::string& program);

/**
 * @brief Run the extraction and write the JSON document.
 *
 * Writes to options.output_path if set, otherwise to out.
 * @return 0 on success (including archives without schema files), 1 on failure
 */
YANGKEYS_API int run_cli(const CliOptions& options, std::ostream& out);

} // namespace YangKeys
