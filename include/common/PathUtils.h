#pragma once

#include <string>
#include <filesystem>

namespace zonerisk {
namespace utils {

class PathUtils {
public:
    // Directory holding the running executable
    static std::filesystem::path getExecutableDir();

    // Absolute paths pass through, relative ones resolve against the executable directory
    static std::filesystem::path resolveRelativePath(const std::string& relative_path);
};

} // namespace utils
} // namespace zonerisk
