#include <archive/scratch_directory.hpp>
#include <utils/logger.hpp>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace YangKeys {

namespace fs = std::filesystem;

ScratchDirectory::ScratchDirectory(const fs::path& parent, const std::string& prefix) {
    fs::path base = parent.empty() ? fs::temp_directory_path() : parent;

    std::string pattern = (base / (prefix + "XXXXXX")).string();
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');

    if (::mkdtemp(buf.data()) == nullptr) {
        throw std::runtime_error("Could not create scratch directory in " + base.string() +
                                 ": " + std::strerror(errno));
    }
    path_ = fs::path(buf.data());
    Logger::debug("Scratch directory: " + path_.string());
}

ScratchDirectory::~ScratchDirectory() {
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        Logger::warn("Could not remove scratch directory " + path_.string() + ": " + ec.message());
    }
}

} // namespace YangKeys
