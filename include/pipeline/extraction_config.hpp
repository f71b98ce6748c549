// extraction_config.hpp
#ifndef YANGKEYS_EXTRACTION_CONFIG_HPP
#define YANGKEYS_EXTRACTION_CONFIG_HPP

#include <cstddef>
#include <cstdlib> // For getenv
#include <filesystem>
#include <stdexcept>
#include <string>

namespace YangKeys {

/**
 * @brief Settings for one extraction run
 */
struct ExtractionConfig {
    std::string extension = ".yang";       // Schema file extension, matched case-sensitively
    char separator = '-';                  // Must appear in the base name before the extension
    size_t sample_bytes = 500;             // Bytes logged from a sample member when nothing matches
    std::filesystem::path scratch_parent;  // Empty: system temp directory

    /**
     * @brief Defaults overridden by YANGKEYS_EXTENSION, YANGKEYS_SEPARATOR,
     *        YANGKEYS_SAMPLE_BYTES and YANGKEYS_TMPDIR.
     * @throws std::runtime_error on malformed values
     */
    static ExtractionConfig load_from_env() {
        ExtractionConfig config;

        const char* extension_env = std::getenv("YANGKEYS_EXTENSION");
        const char* separator_env = std::getenv("YANGKEYS_SEPARATOR");
        const char* sample_env = std::getenv("YANGKEYS_SAMPLE_BYTES");
        const char* tmpdir_env = std::getenv("YANGKEYS_TMPDIR");

        if (extension_env) {
            std::string ext = extension_env;
            if (ext.empty()) throw std::runtime_error("YANGKEYS_EXTENSION must not be empty.");
            config.extension = ext;
        }

        if (separator_env) {
            std::string sep = separator_env;
            if (sep.size() != 1 || sep[0] == '/') {
                throw std::runtime_error("YANGKEYS_SEPARATOR must be a single character other than '/': '" + sep + "'");
            }
            config.separator = sep[0];
        }

        if (sample_env) {
            std::string value = sample_env;
            size_t used = 0;
            unsigned long long n = 0;
            try {
                n = std::stoull(value, &used);
            } catch (const std::exception&) {
                used = 0;
            }
            if (value.empty() || used != value.size() || value[0] == '-') {
                throw std::runtime_error("YANGKEYS_SAMPLE_BYTES is not a byte count: '" + value + "'");
            }
            config.sample_bytes = static_cast<size_t>(n);
        }

        if (tmpdir_env && *tmpdir_env) config.scratch_parent = tmpdir_env;

        return config;
    }
};

} // namespace YangKeys

#endif // YANGKEYS_EXTRACTION_CONFIG_HPP
