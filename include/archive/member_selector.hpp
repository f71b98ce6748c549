/**
 * @file member_selector.hpp
 * @brief Selection of per-table schema files from an archive
 *
 * Schema files follow the naming convention <version>-<name><extension>,
 * e.g. "2.1-interfaces.yang". Files named only after a version
 * ("2.1.yang") are not per-table files and are skipped.
 */

#pragma once

#include <export.hpp>
#include <archive/zip_archive.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace YangKeys {

/**
 * @brief Member name filter for the <version>-<name><extension> convention
 */
struct NamingConvention {
    std::string extension = ".yang";
    char separator = '-';

    /**
     * @brief True if the name is a file (no trailing '/') ending in the extension
     *        whose base name carries the separator before the extension.
     */
    bool matches(const std::string& member_name) const;
};

/**
 * @brief A qualifying member, written to scratch storage
 */
struct SelectedMember {
    std::string archive_path;            // Path inside the archive
    std::filesystem::path extracted_path; // Where its content was written
};

/**
 * @brief Last '/'-separated segment of an archive member name.
 */
YANGKEYS_API std::string member_base_name(const std::string& member_name);

class YANGKEYS_API MemberSelector {
public:
    explicit MemberSelector(NamingConvention convention = NamingConvention());

    const NamingConvention& convention() const { return convention_; }

    /// Members whose names qualify, whether or not they can be extracted.
    size_t count_qualifying(const ZipArchive& archive) const;

    /**
     * @brief Extract every qualifying member below scratch_root.
     *
     * Members that fail to extract are logged and left out.
     * @return Selected members in archive listing order
     */
    std::vector<SelectedMember> select(const ZipArchive& archive, const std::filesystem::path& scratch_root) const;

private:
    NamingConvention convention_;
};

} // namespace YangKeys
