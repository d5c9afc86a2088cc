#include "common/PathUtils.h"

#include <system_error>

namespace levsim {
namespace utils {

std::filesystem::path PathUtils::getExecutableDir() {
    std::error_code ec;
    const auto exe_path = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec || exe_path.empty()) {
        return std::filesystem::current_path();
    }
    return exe_path.parent_path();
}

std::filesystem::path PathUtils::resolveInputPath(const std::string& path) {
    std::filesystem::path candidate(path);
    if (candidate.is_absolute()) {
        return candidate;
    }

    std::error_code ec;
    if (std::filesystem::exists(candidate, ec)) {
        return std::filesystem::absolute(candidate, ec);
    }

    const auto beside_exe = getExecutableDir() / candidate;
    if (std::filesystem::exists(beside_exe, ec)) {
        return beside_exe;
    }
    return candidate;
}

std::filesystem::path PathUtils::resolveOutputPath(const std::string& path) {
    std::filesystem::path candidate(path);
    if (candidate.is_absolute()) {
        return candidate;
    }
    return std::filesystem::current_path() / candidate;
}

} // namespace utils
} // namespace levsim
