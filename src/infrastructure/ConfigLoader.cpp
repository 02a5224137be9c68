/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace docxpdf::infrastructure {

namespace {

constexpr const char* kConfigEnv = "DOCXPDF_CONFIG";
constexpr const char* kPortEnv = "PORT";
constexpr const char* kDefaultSettingsFile = "settings.json";

std::string Lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

// Reads one key; a value of the wrong type is reported and skipped without affecting other keys.
template <typename T>
std::optional<T> ReadKey(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) {
        return std::nullopt;
    }
    try {
        return it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[ConfigLoader] Invalid value for '" << key << "': " << e.what() << std::endl;
        return std::nullopt;
    }
}

} // namespace

std::optional<int> ConfigLoader::ParsePort(const std::string& value) {
    if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    if (value.size() > 5) {
        return std::nullopt;
    }
    int port = std::stoi(value);
    if (port < 1 || port > 65535) {
        return std::nullopt;
    }
    return port;
}

std::optional<domain::BackendKind> ConfigLoader::ParseBackend(const std::string& value) {
    std::string v = Lower(value);
    if (v == "auto") return domain::BackendKind::Auto;
    if (v == "word") return domain::BackendKind::WordAutomation;
    if (v == "libreoffice") return domain::BackendKind::HeadlessOffice;
    return std::nullopt;
}

void ConfigLoader::ApplyJson(const nlohmann::json& j, domain::ServiceConfig& config) {
    if (!j.is_object()) {
        std::cerr << "[ConfigLoader] Settings root must be an object, ignoring" << std::endl;
        return;
    }

    if (auto host = ReadKey<std::string>(j, "host")) config.host = *host;
    if (auto name = ReadKey<std::string>(j, "service_name")) config.serviceName = *name;
    if (auto exe = ReadKey<std::string>(j, "office_executable")) config.officeExecutable = *exe;
    if (auto dir = ReadKey<std::string>(j, "temp_dir")) config.tempDir = *dir;

    if (auto port = ReadKey<int>(j, "port")) {
        if (*port >= 1 && *port <= 65535) {
            config.port = *port;
        } else {
            std::cerr << "[ConfigLoader] Ignoring out-of-range port " << *port << std::endl;
        }
    }

    if (auto name = ReadKey<std::string>(j, "backend")) {
        if (auto backend = ParseBackend(*name)) {
            config.backend = *backend;
        } else {
            std::cerr << "[ConfigLoader] Unknown backend '" << *name << "', expected auto|word|libreoffice" << std::endl;
        }
    }

    if (auto seconds = ReadKey<int>(j, "timeout_seconds")) {
        if (*seconds > 0) {
            config.conversionTimeout = std::chrono::seconds(*seconds);
        } else {
            std::cerr << "[ConfigLoader] Ignoring non-positive timeout_seconds" << std::endl;
        }
    }

    if (auto mb = ReadKey<int>(j, "max_upload_mb")) {
        if (*mb > 0) {
            config.maxUploadBytes = static_cast<std::size_t>(*mb) * 1024 * 1024;
        } else {
            std::cerr << "[ConfigLoader] Ignoring non-positive max_upload_mb" << std::endl;
        }
    }
}

domain::ServiceConfig ConfigLoader::Load(const std::optional<std::string>& settingsPath) {
    domain::ServiceConfig config;

    std::filesystem::path path;
    if (settingsPath) {
        path = *settingsPath;
    } else if (const char* env = std::getenv(kConfigEnv); env && *env) {
        path = env;
    } else {
        path = kDefaultSettingsFile;
    }

    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        try {
            std::ifstream f(path);
            nlohmann::json j;
            f >> j;
            ApplyJson(j, config);
            std::cout << "[ConfigLoader] Loaded " << path.string() << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Error reading " << path.string() << ": " << e.what() << std::endl;
        }
    }

    if (const char* port = std::getenv(kPortEnv); port && *port) {
        if (auto parsed = ParsePort(port)) {
            config.port = *parsed;
        } else {
            std::cerr << "[ConfigLoader] Ignoring invalid PORT value '" << port << "'" << std::endl;
        }
    }

    return config;
}

} // namespace docxpdf::infrastructure
