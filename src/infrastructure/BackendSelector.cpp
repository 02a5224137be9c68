#include "infrastructure/BackendSelector.hpp"

#include "infrastructure/HeadlessOfficeBackend.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/WordAutomationBackend.hpp"

#include <iostream>
#include <stdexcept>

namespace docxpdf::infrastructure {

namespace {

std::string ResolveOfficeExecutable(const std::string& configured) {
    if (auto found = PathUtils::FindExecutable(configured)) {
        return found->string();
    }
    if (auto fallback = PathUtils::FindExecutable("soffice")) {
        std::cout << "[BackendSelector] '" << configured << "' not on PATH, using " << fallback->string() << std::endl;
        return fallback->string();
    }
    std::cerr << "[BackendSelector] WARNING: office executable '" << configured
              << "' not found. Conversions will fail until it is installed." << std::endl;
    return configured;
}

} // namespace

std::unique_ptr<domain::ConverterBackend> BackendSelector::Select(const domain::ServiceConfig& config) {
    using domain::BackendKind;

    if (config.backend == BackendKind::WordAutomation) {
        if (!WordAutomationBackend::IsAvailable()) {
            throw std::runtime_error("Word automation backend requested but Microsoft Word is not available");
        }
        std::cout << "[BackendSelector] Using Word automation (configured)" << std::endl;
        return std::make_unique<WordAutomationBackend>();
    }

    if (config.backend == BackendKind::Auto && WordAutomationBackend::IsAvailable()) {
        std::cout << "[BackendSelector] Word detected, using Word automation" << std::endl;
        return std::make_unique<WordAutomationBackend>();
    }

    std::string executable = ResolveOfficeExecutable(config.officeExecutable);
    std::cout << "[BackendSelector] Using headless office: " << executable
              << " (timeout " << config.conversionTimeout.count() << "s)" << std::endl;
    return std::make_unique<HeadlessOfficeBackend>(executable, config.conversionTimeout);
}

} // namespace docxpdf::infrastructure
