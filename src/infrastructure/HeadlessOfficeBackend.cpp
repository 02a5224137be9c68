#include "infrastructure/HeadlessOfficeBackend.hpp"

#include "domain/ConversionResult.hpp"
#include "infrastructure/ProcessRunner.hpp"

#include <filesystem>
#include <iostream>

namespace docxpdf::infrastructure {

namespace fs = std::filesystem;

HeadlessOfficeBackend::HeadlessOfficeBackend(const std::string& executable, std::chrono::milliseconds timeout)
    : m_executable(executable)
    , m_timeout(timeout)
{}

std::vector<std::string> HeadlessOfficeBackend::BuildCommand(const std::string& executable,
                                                             const std::string& outputDir,
                                                             const std::string& inputPath) {
    return {executable, "--headless", "--convert-to", "pdf", "--outdir", outputDir, inputPath};
}

std::string HeadlessOfficeBackend::convert(const std::string& inputPath, const std::string& outputPath) {
    fs::path outDir = fs::path(outputPath).parent_path();
    if (outDir.empty()) {
        outDir = ".";
    }

    std::error_code ec;
    fs::create_directories(outDir, ec);
    if (ec) {
        throw domain::ConversionError(domain::FailureKind::StorageError,
                                      "Cannot create output directory " + outDir.string() + ": " + ec.message());
    }

    auto cmd = BuildCommand(m_executable, outDir.string(), inputPath);
    std::cout << "[HeadlessOffice] Running: " << m_executable << " --headless --convert-to pdf --outdir "
              << outDir.string() << " " << inputPath << std::endl;

    ProcessResult result = ProcessRunner::Run(cmd, m_timeout);

    if (!result.launched) {
        throw domain::ConversionError(domain::FailureKind::ConversionEngineError,
                                      "LibreOffice conversion failed: " + result.stdErr);
    }
    if (result.timedOut) {
        auto seconds = std::chrono::duration_cast<std::chrono::seconds>(m_timeout).count();
        throw domain::ConversionError(domain::FailureKind::ConversionTimeout,
                                      "Conversion timed out after " + std::to_string(seconds) + " seconds");
    }
    if (result.exitCode != 0) {
        throw domain::ConversionError(domain::FailureKind::ConversionEngineError,
                                      "LibreOffice conversion failed: " + result.stdErr);
    }

    std::cout << "[HeadlessOffice] Finished in " << result.elapsed.count() << " ms" << std::endl;
    return (outDir / (fs::path(inputPath).stem().string() + ".pdf")).string();
}

} // namespace docxpdf::infrastructure
