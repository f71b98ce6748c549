#include <archive/member_selector.hpp>
#include <utils/logger.hpp>
#include <utility>

namespace YangKeys {

std::string member_base_name(const std::string& member_name) {
    size_t slash = member_name.rfind('/');
    return slash == std::string::npos ? member_name : member_name.substr(slash + 1);
}

bool NamingConvention::matches(const std::string& member_name) const {
    if (member_name.empty() || member_name.back() == '/') return false;
    if (member_name.size() < extension.size()) return false;
    if (member_name.compare(member_name.size() - extension.size(), extension.size(), extension) != 0) {
        return false;
    }

    std::string base = member_base_name(member_name);
    if (base.size() < extension.size()) return false; // Extension spans a '/'
    std::string stem = base.substr(0, base.size() - extension.size());
    return stem.find(separator) != std::string::npos;
}

MemberSelector::MemberSelector(NamingConvention convention) : convention_(std::move(convention)) {}

size_t MemberSelector::count_qualifying(const ZipArchive& archive) const {
    size_t count = 0;
    for (const auto& entry : archive.entries()) {
        if (convention_.matches(entry.name)) ++count;
    }
    return count;
}

std::vector<SelectedMember> MemberSelector::select(const ZipArchive& archive,
                                                   const std::filesystem::path& scratch_root) const {
    std::vector<SelectedMember> selected;

    if (Logger::enabled(Logger::Level::Debug)) {
        Logger::debug("Archive " + archive.path().string() + " has " +
                      std::to_string(archive.entries().size()) + " members");
        for (const auto& entry : archive.entries()) {
            Logger::debug("  " + entry.name);
        }
    }

    for (const auto& entry : archive.entries()) {
        if (!convention_.matches(entry.name)) continue;

        try {
            SelectedMember member;
            member.archive_path = entry.name;
            member.extracted_path = archive.extract(entry, scratch_root);
            selected.push_back(std::move(member));
            Logger::info("Extracted: " + entry.name);
        } catch (const MemberReadError& e) {
            Logger::error("Skipping " + entry.name + ": " + e.what());
        }
    }

    Logger::info("Total extracted schema files: " + std::to_string(selected.size()));
    return selected;
}

} // namespace YangKeys
