/**
 * @file ConversionDispatcher.hpp
 * @brief Normalizes both converter backends into "PDF at the requested path" or a classified error.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>

#include "domain/ConverterBackend.hpp"

namespace docxpdf::application {

/**
 * @class ConversionDispatcher
 * @brief Runs one conversion through the backend selected at startup.
 *
 * Every failure is raised as domain::ConversionError. There are no retries:
 * a single backend invocation either succeeds or its failure is surfaced.
 */
class ConversionDispatcher {
public:
    /**
     * @param backend The converter chosen once at process start.
     * @param tempDir Base directory for convertToBytes scratch space (empty = system temp).
     */
    explicit ConversionDispatcher(std::shared_ptr<domain::ConverterBackend> backend, std::string tempDir = {});

    /**
     * @brief Converts into outputDir (created if missing) as "<input stem>.pdf".
     * @param outputDir Defaults to the input file's directory.
     * @return Path of the generated PDF.
     */
    std::string convert(const std::string& inputPath, const std::optional<std::string>& outputDir = std::nullopt);

    /**
     * @brief Converts to an explicit target path, moving the engine's output there if it named it differently.
     * @return outputPath.
     */
    std::string convertTo(const std::string& inputPath, const std::string& outputPath);

    /** @brief Converts in a scratch directory and returns the PDF bytes. Nothing is left on disk. */
    std::string convertToBytes(const std::string& inputPath);

private:
    std::shared_ptr<domain::ConverterBackend> m_backend;
    std::string m_tempDir;
};

} // namespace docxpdf::application
