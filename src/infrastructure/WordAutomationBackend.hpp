#pragma once

#include "domain/ConverterBackend.hpp"
#include <string>

namespace docxpdf::infrastructure {

/**
 * @class WordAutomationBackend
 * @brief Drives Microsoft Word through COM automation (Windows only).
 *
 * Every call initializes a COM apartment on the calling thread and releases it
 * afterwards, including when the conversion fails. No timeout is enforced: a
 * hung Word instance blocks the caller.
 */
class WordAutomationBackend : public domain::ConverterBackend {
public:
    WordAutomationBackend() = default;
    ~WordAutomationBackend() override = default;

    /** @brief True when running on Windows with "Word.Application" registered. */
    static bool IsAvailable();

    std::string name() const override { return "word"; }

    std::string convert(const std::string& inputPath, const std::string& outputPath) override;
};

} // namespace docxpdf::infrastructure
