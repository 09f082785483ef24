#pragma once

#include <string>
#include <filesystem>

namespace finpack {
namespace utils {

class PathUtils {
public:
    // Directory of the running executable (falls back to the working directory)
    static std::filesystem::path getExecutableDir();

    // Relative path resolved against the executable directory
    static std::filesystem::path resolveRelativePath(const std::string& relative_path);

    static std::filesystem::path getConfigDir();
};

} // namespace utils
} // namespace finpack
