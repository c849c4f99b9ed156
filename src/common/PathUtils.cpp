#include "common/PathUtils.h"

#include <system_error>

namespace zonerisk {
namespace utils {

std::filesystem::path PathUtils::getExecutableDir() {
    std::error_code ec;
    std::filesystem::path exe_path = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec || exe_path.empty()) {
        return std::filesystem::current_path();
    }
    return exe_path.parent_path();
}

std::filesystem::path PathUtils::resolveRelativePath(const std::string& relative_path) {
    std::filesystem::path p(relative_path);
    if (p.is_absolute()) {
        return p;
    }
    return getExecutableDir() / p;
}

} // namespace utils
} // namespace zonerisk
