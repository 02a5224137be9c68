/**
 * @file ConverterBackend.hpp
 * @brief Interface for engines that render a word-processing document to PDF.
 */

#pragma once

#include <string>

namespace docxpdf::domain {

/**
 * @class ConverterBackend
 * @brief Abstract interface for the external rendering engines.
 *
 * Implementations are opaque converters: given an input document and the path
 * the caller would like the PDF at, they either produce a PDF or throw
 * domain::ConversionError.
 */
class ConverterBackend {
public:
    virtual ~ConverterBackend() = default;

    /** @brief Short identifier used in logs ("word", "libreoffice"). */
    virtual std::string name() const = 0;

    /**
     * @brief Renders inputPath to PDF.
     * @param inputPath Existing document on disk.
     * @param outputPath Where the caller wants the PDF. Engines that cannot choose
     *        their output name write next to it instead.
     * @return The path the engine reports having written.
     */
    virtual std::string convert(const std::string& inputPath, const std::string& outputPath) = 0;
};

} // namespace docxpdf::domain
