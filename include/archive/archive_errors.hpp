#pragma once

#include <stdexcept>
#include <string>

namespace YangKeys {

/**
 * @brief The archive is missing, unreadable, or not a valid ZIP file.
 *
 * Fatal for a run.
 */
class ArchiveOpenError : public std::runtime_error {
public:
    explicit ArchiveOpenError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief One member could not be decoded, decompressed or written out.
 *
 * Recovered: the member contributes nothing and the run continues.
 */
class MemberReadError : public std::runtime_error {
public:
    explicit MemberReadError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace YangKeys
