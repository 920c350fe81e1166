#include "common/PathUtils.h"

#include <system_error>

namespace replaybt {
namespace utils {

std::filesystem::path PathUtils::getExecutableDir() {
    std::error_code ec;
    const auto exe_path = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec || exe_path.empty()) {
        return std::filesystem::current_path();
    }
    return exe_path.parent_path();
}

std::filesystem::path PathUtils::resolveRelativePath(const std::string& relative_path) {
    const std::filesystem::path local(relative_path);
    if (std::filesystem::exists(local)) {
        return std::filesystem::absolute(local);
    }
    return getExecutableDir() / relative_path;
}

std::filesystem::path PathUtils::getLogsDir() {
    return getExecutableDir() / "logs";
}

} // namespace utils
} // namespace replaybt
