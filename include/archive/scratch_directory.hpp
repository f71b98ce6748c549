#pragma once

#include <export.hpp>
#include <filesystem>
#include <string>

namespace YangKeys {

/**
 * @brief Uniquely named temporary directory, removed recursively on destruction.
 */
class YANGKEYS_API ScratchDirectory {
public:
    /**
     * @param parent Directory to create the scratch area in; empty means the system temp directory
     * @throws std::runtime_error if the directory cannot be created
     */
    explicit ScratchDirectory(const std::filesystem::path& parent = {},
                              const std::string& prefix = "yangkeys-");
    ~ScratchDirectory();

    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace YangKeys
