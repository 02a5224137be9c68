/**
 * @file ConversionService.hpp
 * @brief Request-handling core shared by the interactive and API endpoints.
 */

#pragma once

#include <filesystem>
#include <memory>

#include "application/ConversionDispatcher.hpp"
#include "domain/ConversionRequest.hpp"
#include "domain/ConversionResult.hpp"
#include "domain/ServiceConfig.hpp"

namespace docxpdf::application {

/**
 * @class ConversionService
 * @brief Validates an upload, stages it, dispatches the conversion and returns the PDF bytes.
 *
 * Uploads and outputs are staged under uniquely-prefixed names in the shared temp
 * directory and removed before convert() returns, on every path. Errors never
 * escape: they come back as a failed domain::ConversionResult.
 */
class ConversionService {
public:
    ConversionService(std::shared_ptr<ConversionDispatcher> dispatcher, const domain::ServiceConfig& config);

    domain::ConversionResult convert(const domain::ConversionRequest& request);

    /** @brief Default client-facing message for a failure class. */
    static std::string DescribeValidationFailure(domain::FailureKind kind);

    const std::filesystem::path& tempDir() const { return m_tempDir; }

private:
    domain::ConversionResult convertValidated(const domain::ConversionRequest& request);

    std::shared_ptr<ConversionDispatcher> m_dispatcher;
    std::filesystem::path m_tempDir;
};

} // namespace docxpdf::application
