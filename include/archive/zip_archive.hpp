/**
 * @file zip_archive.hpp
 * @brief Read-only ZIP archive access through libarchive
 *
 * The archive is located by its central directory. Member content is
 * decompressed by libarchive, so every method it was built with is
 * available (stored, deflate, bzip2, LZMA, XZ, zstd).
 */

#pragma once

#include <export.hpp>
#include <archive/archive_errors.hpp>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <string>
#include <vector>

namespace YangKeys {

/**
 * @brief One archive member as listed by the archive
 */
struct ZipEntry {
    std::string name;          // Archive-internal path, '/' separated
    size_t index = 0;          // Position in listing order
    uint64_t size = 0;         // Uncompressed size, 0 if the archive does not record it
    bool directory = false;
    bool encrypted = false;

    bool is_directory() const { return directory || (!name.empty() && name.back() == '/'); }
    bool is_encrypted() const { return encrypted; }
};

class YANGKEYS_API ZipArchive {
public:
    static constexpr size_t k_unlimited = std::numeric_limits<size_t>::max();

    /**
     * @brief Open an archive and list its members.
     * @throws ArchiveOpenError if the file is missing or not a valid ZIP archive
     */
    explicit ZipArchive(const std::filesystem::path& path);

    ZipArchive(const ZipArchive&) = delete;
    ZipArchive& operator=(const ZipArchive&) = delete;

    const std::filesystem::path& path() const { return path_; }

    /**
     * @brief Members in listing order.
     */
    const std::vector<ZipEntry>& entries() const { return entries_; }

    std::vector<std::string> names() const;

    /**
     * @brief Read (and decompress) a member.
     * @param max_bytes Stop after this many bytes
     * @throws MemberReadError on encrypted members, unsupported methods,
     *         corrupt data or checksum mismatch
     */
    std::string read(const ZipEntry& entry, size_t max_bytes = k_unlimited) const;

    /**
     * @brief Write a member below destination_root, keeping its relative path.
     * @return Path of the written file
     * @throws MemberReadError
     */
    std::filesystem::path extract(const ZipEntry& entry, const std::filesystem::path& destination_root) const;

    /**
     * @brief Map an archive-internal name to a relative path that stays inside
     *        the destination ('..', '.', empty and root components dropped).
     */
    static std::filesystem::path sanitized_relative_path(const std::string& name);

private:
    std::filesystem::path path_;
    std::vector<ZipEntry> entries_;
};

} // namespace YangKeys
