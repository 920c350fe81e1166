#pragma once

#include <string>
#include <filesystem>

namespace replaybt {
namespace utils {

class PathUtils {
public:
    // Directory containing the running executable (falls back to the CWD)
    static std::filesystem::path getExecutableDir();
    
    // Relative paths are resolved against the executable directory
    static std::filesystem::path resolveRelativePath(const std::string& relative_path);
    
    static std::filesystem::path getLogsDir();
};

} // namespace utils
} // namespace replaybt
