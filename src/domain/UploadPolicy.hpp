/**
 * @file UploadPolicy.hpp
 * @brief Rules an uploaded document must satisfy before anything touches the disk.
 */

#pragma once

#include <optional>
#include <string>

#include "domain/ConversionRequest.hpp"
#include "domain/ConversionResult.hpp"

namespace docxpdf::domain {

/**
 * @class UploadPolicy
 * @brief Extension allow-list, filename sanitization and output-name derivation.
 */
class UploadPolicy {
public:
    /** @brief True when the name has a '.' and its last extension is "docx" in any case. */
    static bool IsAllowedFile(const std::string& filename);

    /**
     * @brief Reduces a client-supplied filename to a safe basename.
     *
     * Drops non-ASCII bytes, turns path separators and whitespace runs into '_',
     * keeps only [A-Za-z0-9_.-] and trims leading/trailing '.' and '_'.
     * May return an empty string.
     */
    static std::string SecureFilename(const std::string& filename);

    /** @brief "Report.DOCX" -> "Report.pdf". */
    static std::string PdfNameFor(const std::string& filename);

    /**
     * @brief Runs the checks in order (field, name, extension) and returns the first failure.
     * @return std::nullopt when the request is acceptable.
     */
    static std::optional<FailureKind> Validate(const ConversionRequest& request);
};

} // namespace docxpdf::domain
