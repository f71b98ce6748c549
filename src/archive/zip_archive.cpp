/**
 * @file zip_archive.cpp
 * @brief libarchive-backed ZIP listing, decompression and extraction
 */

#include <archive/zip_archive.hpp>
#include <archive.h>
#include <archive_entry.h>
#include <algorithm>
#include <fstream>
#include <memory>
#include <system_error>

namespace YangKeys {

namespace fs = std::filesystem;

namespace {

constexpr size_t k_block_size = 64 * 1024;

struct ArchiveReadDeleter {
    void operator()(struct archive* a) const { archive_read_free(a); }
};

using ArchiveReader = std::unique_ptr<struct archive, ArchiveReadDeleter>;

std::string error_text(struct archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown libarchive error";
}

// Only the seekable ZIP reader is enabled: an archive without a readable
// central directory is rejected instead of being streamed from local headers.
ArchiveReader open_reader(const fs::path& path) {
    ArchiveReader reader(archive_read_new());
    if (!reader) {
        throw ArchiveOpenError("archive_read_new failed for " + path.string());
    }
    archive_read_support_filter_all(reader.get());
    archive_read_support_format_zip_seekable(reader.get());

    if (archive_read_open_filename(reader.get(), path.c_str(), static_cast<size_t>(k_block_size)) != ARCHIVE_OK) {
        throw ArchiveOpenError("Could not open archive " + path.string() + ": " + error_text(reader.get()));
    }
    return reader;
}

std::string entry_name(struct archive_entry* header) {
    if (const char* utf8 = archive_entry_pathname_utf8(header)) return utf8;
    if (const char* raw = archive_entry_pathname(header)) return raw;
    return {};
}

} // namespace

ZipArchive::ZipArchive(const fs::path& path) : path_(path) {
    std::error_code ec;
    if (!fs::is_regular_file(path_, ec)) {
        throw ArchiveOpenError("Archive not found or not a regular file: " + path_.string());
    }

    ArchiveReader reader = open_reader(path_);
    struct archive_entry* header = nullptr;

    for (;;) {
        int r = archive_read_next_header(reader.get(), &header);
        if (r == ARCHIVE_EOF) break;
        if (r < ARCHIVE_WARN) {
            throw ArchiveOpenError("Corrupt archive " + path_.string() + ": " + error_text(reader.get()));
        }

        ZipEntry entry;
        entry.name = entry_name(header);
        entry.index = entries_.size();
        entry.size = archive_entry_size_is_set(header) ? static_cast<uint64_t>(archive_entry_size(header)) : 0;
        entry.directory = archive_entry_filetype(header) == AE_IFDIR;
        entry.encrypted = archive_entry_is_data_encrypted(header) != 0;
        entries_.push_back(std::move(entry));
    }
}

std::vector<std::string> ZipArchive::names() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& e : entries_) result.push_back(e.name);
    return result;
}

std::string ZipArchive::read(const ZipEntry& entry, size_t max_bytes) const {
    if (entry.is_encrypted()) {
        throw MemberReadError("Encrypted member is not supported: " + entry.name);
    }

    ArchiveReader reader;
    try {
        reader = open_reader(path_);
    } catch (const ArchiveOpenError& e) {
        throw MemberReadError("Could not reopen archive for " + entry.name + ": " + e.what());
    }

    // libarchive reads sequentially; skip to the member's position
    struct archive_entry* header = nullptr;
    for (size_t i = 0; ; ++i) {
        int r = archive_read_next_header(reader.get(), &header);
        if (r == ARCHIVE_EOF) {
            throw MemberReadError("Member no longer present in archive: " + entry.name);
        }
        if (r < ARCHIVE_WARN) {
            throw MemberReadError("Could not locate " + entry.name + ": " + error_text(reader.get()));
        }
        if (i == entry.index) break;
    }
    if (entry_name(header) != entry.name) {
        throw MemberReadError("Archive changed while reading " + entry.name);
    }

    std::string out;
    std::vector<char> block(k_block_size);
    while (out.size() < max_bytes) {
        size_t want = std::min(block.size(), max_bytes - out.size());
        la_ssize_t n = archive_read_data(reader.get(), block.data(), want);
        if (n < 0) {
            throw MemberReadError("Could not decompress " + entry.name + ": " + error_text(reader.get()));
        }
        if (n == 0) break;
        out.append(block.data(), static_cast<size_t>(n));
    }
    return out;
}

fs::path ZipArchive::sanitized_relative_path(const std::string& name) {
    fs::path result;
    size_t start = 0;
    while (start <= name.size()) {
        size_t end = name.find_first_of("/\\", start);
        if (end == std::string::npos) end = name.size();
        std::string part = name.substr(start, end - start);
        if (!part.empty() && part != "." && part != "..") {
            result /= part;
        }
        start = end + 1;
    }
    return result;
}

fs::path ZipArchive::extract(const ZipEntry& entry, const fs::path& destination_root) const {
    fs::path relative = sanitized_relative_path(entry.name);
    if (relative.empty()) {
        throw MemberReadError("Member name has no usable path: '" + entry.name + "'");
    }
    fs::path target = destination_root / relative;

    std::error_code ec;
    if (entry.is_directory()) {
        fs::create_directories(target, ec);
        if (ec) throw MemberReadError("Could not create " + target.string() + ": " + ec.message());
        return target;
    }

    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        throw MemberReadError("Could not create " + target.parent_path().string() + ": " + ec.message());
    }

    std::string content = read(entry);

    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw MemberReadError("Could not write " + target.string());
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!out) {
        throw MemberReadError("Write failed for " + target.string());
    }
    return target;
}

} // namespace YangKeys
