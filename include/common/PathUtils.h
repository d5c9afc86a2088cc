#pragma once

#include <string>
#include <filesystem>

namespace levsim {
namespace utils {

class PathUtils {
public:
    // Directory of the running executable (falls back to the working directory)
    static std::filesystem::path getExecutableDir();

    // Existing input file: working directory first, then executable directory
    static std::filesystem::path resolveInputPath(const std::string& path);

    // Output location: absolute paths kept, relative ones anchored at the working directory
    static std::filesystem::path resolveOutputPath(const std::string& path);
};

} // namespace utils
} // namespace levsim
