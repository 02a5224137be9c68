#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <vector>

#if !defined(_WIN32)
#include <unistd.h>
#endif

namespace docxpdf::infrastructure {

namespace fs = std::filesystem;

namespace {

#if defined(_WIN32)
constexpr char kPathListSeparator = ';';
#else
constexpr char kPathListSeparator = ':';
#endif

std::vector<std::string> SplitPathList(const std::string& value) {
    std::vector<std::string> dirs;
    std::stringstream ss(value);
    std::string dir;
    while (std::getline(ss, dir, kPathListSeparator)) {
        if (!dir.empty()) dirs.push_back(dir);
    }
    return dirs;
}

} // namespace

fs::path PathUtils::GetTempDir(const std::string& configured) {
    fs::path base;
    if (!configured.empty()) {
        base = configured;
    } else {
        std::error_code ec;
        base = fs::temp_directory_path(ec);
        if (ec) {
            base = fs::current_path(); // Fallback
        }
    }

    std::error_code ec;
    if (!fs::exists(base, ec)) {
        fs::create_directories(base, ec);
        if (ec) {
            std::cerr << "[PathUtils] Could not create temp dir " << base << ": " << ec.message() << std::endl;
        }
    }
    return base;
}

bool PathUtils::IsExecutable(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return false;
    }
#if defined(_WIN32)
    return true;
#else
    return ::access(path.c_str(), X_OK) == 0;
#endif
}

std::optional<fs::path> PathUtils::FindExecutable(const std::string& name) {
    if (name.empty()) {
        return std::nullopt;
    }

    fs::path candidate(name);
    if (candidate.has_parent_path()) {
        if (IsExecutable(candidate)) return candidate;
        return std::nullopt;
    }

    const char* pathEnv = std::getenv("PATH");
    if (!pathEnv || !*pathEnv) {
        return std::nullopt;
    }

    for (const auto& dir : SplitPathList(pathEnv)) {
        fs::path full = fs::path(dir) / name;
        if (IsExecutable(full)) return full;
#if defined(_WIN32)
        fs::path withExe = full;
        withExe += ".exe";
        if (IsExecutable(withExe)) return withExe;
#endif
    }
    return std::nullopt;
}

} // namespace docxpdf::infrastructure
