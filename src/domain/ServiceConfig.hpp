/**
 * @file ServiceConfig.hpp
 * @brief Immutable process-wide settings, computed once at startup.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace docxpdf::domain {

/**
 * @enum BackendKind
 * @brief Which converter the process should use. Auto defers to the startup probe.
 */
enum class BackendKind {
    Auto,
    WordAutomation,
    HeadlessOffice
};

struct ServiceConfig {
    std::string host = "0.0.0.0";
    int port = 5005;
    std::string serviceName = "docx-to-pdf-converter";

    BackendKind backend = BackendKind::Auto;
    std::string officeExecutable = "libreoffice";
    std::chrono::seconds conversionTimeout{120};

    std::size_t maxUploadBytes = 16 * 1024 * 1024;
    std::string tempDir; ///< Empty means the system temp directory.
};

} // namespace docxpdf::domain
