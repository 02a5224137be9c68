// PathUtils Header
#pragma once
#include <filesystem>
#include <optional>
#include <string>

namespace docxpdf::infrastructure {

class PathUtils {
public:
    /** @brief The configured directory, or the system temp directory when empty. Created if missing. */
    static std::filesystem::path GetTempDir(const std::string& configured = {});

    /** @brief Resolves a program name against PATH. Names containing a separator are checked as-is. */
    static std::optional<std::filesystem::path> FindExecutable(const std::string& name);

    static bool IsExecutable(const std::filesystem::path& path);
};

} // namespace docxpdf::infrastructure
