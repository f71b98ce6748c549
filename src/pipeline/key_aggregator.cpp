#include <pipeline/key_aggregator.hpp>
#include <archive/scratch_directory.hpp>
#include <archive/zip_archive.hpp>
#include <schema/declaration_scanner.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <utils/unicode.hpp>
#include <iomanip>
#include <sstream>

namespace YangKeys {

namespace fs = std::filesystem;

namespace {

NamingConvention convention_for(const ExtractionConfig& config) {
    NamingConvention convention;
    convention.extension = config.extension;
    convention.separator = config.separator;
    return convention;
}

} // namespace

KeyAggregator::KeyAggregator(const ExtractionConfig& config)
    : config_(config), selector_(convention_for(config)) {}

ResultMapping KeyAggregator::extract_from_archive(const fs::path& archive_path) {
    Timer timer;
    stats_ = AggregationStats();
    ResultMapping result;

    ScratchDirectory scratch(config_.scratch_parent);
    ZipArchive archive(archive_path);
    stats_.members_total = archive.entries().size();

    stats_.members_qualifying = selector_.count_qualifying(archive);
    auto members = selector_.select(archive, scratch.path());
    stats_.members_selected = members.size();

    if (stats_.members_qualifying == 0) {
        Logger::warn("No schema files found matching the pattern <version>" +
                     std::string(1, config_.separator) + "<yangTableName>" + config_.extension);
        log_sample_member(archive);
    } else if (members.empty()) {
        Logger::warn(std::to_string(stats_.members_qualifying) +
                     " schema file(s) matched the naming pattern but none could be extracted");
    }

    for (const auto& member : members) {
        Logger::step("Parsing: " + member.archive_path);
        try {
            ResultMapping per_member = extract_keys_from_file(member.extracted_path);
            stats_.declarations += per_member.size();
            result.merge(per_member, [&](const std::string& entity,
                                         const KeyRepresentation& previous,
                                         const KeyRepresentation& replacement) {
                ++stats_.overwrites;
                Logger::warn("Key of " + entity + " overwritten by " + member.archive_path + ": " +
                             describe(previous) + " -> " + describe(replacement));
            });
        } catch (const std::exception& e) {
            Logger::error("Error parsing " + member.archive_path + ": " + e.what());
        }
    }

    stats_.elapsed_ms = timer.elapsed_ms();
    std::ostringstream summary;
    summary << "Collected " << result.size() << " tables from " << stats_.members_selected
            << " of " << stats_.members_total << " archive members in "
            << std::fixed << std::setprecision(1) << stats_.elapsed_ms << " ms";
    Logger::success(summary.str());
    return result;
}

void KeyAggregator::log_sample_member(const ZipArchive& archive) const {
    for (const auto& entry : archive.entries()) {
        if (entry.is_directory()) continue;
        const std::string& name = entry.name;
        if (name.size() < config_.extension.size() ||
            name.compare(name.size() - config_.extension.size(), config_.extension.size(), config_.extension) != 0) {
            continue;
        }

        Logger::info("Examining sample file: " + name);
        try {
            std::string head = archive.read(entry, config_.sample_bytes);
            Logger::info("Sample content: " + sanitize_utf8(head));
        } catch (const std::exception& e) {
            Logger::debug("Could not read sample " + name + ": " + e.what());
        }
        return;
    }
}

} // namespace YangKeys
