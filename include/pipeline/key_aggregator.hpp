/**
 * @file key_aggregator.hpp
 * @brief Archive → entity/key mapping pipeline
 *
 * Runs the member selector over an archive, extracts declarations from each
 * selected member in listing order and merges them (last write wins).
 */

#pragma once

#include <export.hpp>
#include <archive/member_selector.hpp>
#include <pipeline/extraction_config.hpp>
#include <schema/key_declaration.hpp>
#include <filesystem>

namespace YangKeys {

/**
 * @brief Per-run counters
 */
struct AggregationStats {
    size_t members_total = 0;      // Entries in the archive
    size_t members_qualifying = 0; // Names following the convention
    size_t members_selected = 0;   // Qualifying and extracted
    size_t declarations = 0;       // Sum of per-member mapping sizes
    size_t overwrites = 0;         // Entities replaced with a different key
    double elapsed_ms = 0.0;
};

class YANGKEYS_API KeyAggregator {
public:
    explicit KeyAggregator(const ExtractionConfig& config = ExtractionConfig());

    /**
     * @brief Extract the entity → key mapping from every qualifying member.
     *
     * Scratch storage is removed before returning, whether or not the run succeeds.
     * @throws ArchiveOpenError if the archive cannot be opened
     */
    ResultMapping extract_from_archive(const std::filesystem::path& archive_path);

    const AggregationStats& last_stats() const { return stats_; }

private:
    void log_sample_member(const ZipArchive& archive) const;

    ExtractionConfig config_;
    MemberSelector selector_;
    AggregationStats stats_;
};

} // namespace YangKeys
