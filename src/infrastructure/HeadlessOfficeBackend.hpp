#pragma once

#include "domain/ConverterBackend.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace docxpdf::infrastructure {

/**
 * @class HeadlessOfficeBackend
 * @brief Renders documents by running the office suite in headless batch mode.
 *
 * The office process names its output after the input's stem inside --outdir,
 * so the returned path may differ from the requested one.
 */
class HeadlessOfficeBackend : public domain::ConverterBackend {
public:
    HeadlessOfficeBackend(const std::string& executable, std::chrono::milliseconds timeout);
    ~HeadlessOfficeBackend() override = default;

    std::string name() const override { return "libreoffice"; }

    std::string convert(const std::string& inputPath, const std::string& outputPath) override;

    /** @brief {exe, --headless, --convert-to, pdf, --outdir, dir, input}. */
    static std::vector<std::string> BuildCommand(const std::string& executable,
                                                 const std::string& outputDir,
                                                 const std::string& inputPath);

private:
    std::string m_executable;
    std::chrono::milliseconds m_timeout;
};

} // namespace docxpdf::infrastructure
