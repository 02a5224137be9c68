/**
 * @file ConfigLoader.hpp
 * @brief Static utility that builds the immutable ServiceConfig (defaults, settings.json, environment).
 */

#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "domain/ServiceConfig.hpp"

namespace docxpdf::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Defaults, then settings.json, then the PORT environment variable.
     * @param settingsPath Explicit settings file. When empty, DOCXPDF_CONFIG is used,
     *        then ./settings.json. A missing file is not an error.
     */
    static domain::ServiceConfig Load(const std::optional<std::string>& settingsPath = std::nullopt);

    /**
     * @brief Overlays recognised keys of a settings object onto config.
     * Invalid values are reported and skipped.
     */
    static void ApplyJson(const nlohmann::json& j, domain::ServiceConfig& config);

    /** @brief Parses a TCP port (1-65535). */
    static std::optional<int> ParsePort(const std::string& value);

    static std::optional<domain::BackendKind> ParseBackend(const std::string& value);
};

} // namespace docxpdf::infrastructure
