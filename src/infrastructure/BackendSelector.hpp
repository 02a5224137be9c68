/**
 * @file BackendSelector.hpp
 * @brief One-time startup probe that picks the converter backend.
 */

#pragma once

#include <memory>

#include "domain/ConverterBackend.hpp"
#include "domain/ServiceConfig.hpp"

namespace docxpdf::infrastructure {

class BackendSelector {
public:
    /**
     * @brief Builds the backend the configuration asks for.
     *
     * Auto prefers Word automation when it is installed and otherwise runs the
     * office suite headless. The office executable is resolved on PATH, trying
     * "soffice" when the configured name is not found.
     *
     * @throws std::runtime_error if Word automation is requested explicitly but unavailable.
     */
    static std::unique_ptr<domain::ConverterBackend> Select(const domain::ServiceConfig& config);
};

} // namespace docxpdf::infrastructure
