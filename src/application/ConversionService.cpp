/**
 * @file ConversionService.cpp
 * @brief Implementation of ConversionService.
 */

#include "application/ConversionService.hpp"

#include "domain/UploadPolicy.hpp"
#include "infrastructure/BinaryFile.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/TempArtifact.hpp"

#include <chrono>
#include <iostream>

namespace fs = std::filesystem;

namespace docxpdf::application {

using domain::ConversionResult;
using domain::FailureKind;
using domain::UploadPolicy;

ConversionService::ConversionService(std::shared_ptr<ConversionDispatcher> dispatcher, const domain::ServiceConfig& config)
    : m_dispatcher(std::move(dispatcher))
    , m_tempDir(infrastructure::PathUtils::GetTempDir(config.tempDir)) {}

std::string ConversionService::DescribeValidationFailure(FailureKind kind) {
    switch (kind) {
        case FailureKind::MissingFile: return "No file provided";
        case FailureKind::EmptyFilename: return "No file selected";
        case FailureKind::InvalidExtension: return "Invalid file type. Only .docx files are allowed";
        case FailureKind::InvalidFilename: return "Invalid filename";
        default: return domain::ToString(kind);
    }
}

ConversionResult ConversionService::convert(const domain::ConversionRequest& request) {
    if (auto failure = UploadPolicy::Validate(request)) {
        std::cout << "[ConversionService] Rejected upload '" << request.originalFilename
                  << "': " << domain::ToString(*failure) << std::endl;
        return ConversionResult::Failure(*failure, DescribeValidationFailure(*failure));
    }

    try {
        return convertValidated(request);
    } catch (const domain::ConversionError& e) {
        std::cerr << "[ConversionService] " << domain::ToString(e.kind()) << ": " << e.what() << std::endl;
        return ConversionResult::Failure(e.kind(), e.what());
    } catch (const std::exception& e) {
        std::cerr << "[ConversionService] Unexpected error: " << e.what() << std::endl;
        return ConversionResult::Failure(FailureKind::StorageError, e.what());
    }
}

ConversionResult ConversionService::convertValidated(const domain::ConversionRequest& request) {
    auto start = std::chrono::steady_clock::now();

    const std::string filename = UploadPolicy::SecureFilename(request.originalFilename);
    const std::string pdfName = UploadPolicy::PdfNameFor(filename);

    // Declared before any file exists so both are removed on every return path.
    infrastructure::TempArtifact input = infrastructure::TempArtifact::InDirectory(m_tempDir, filename);
    infrastructure::TempArtifact output(m_tempDir / (input.path().stem().string() + ".pdf"));

    std::string error;
    if (!infrastructure::BinaryFile::Write(input.path(), request.sourceBytes, error)) {
        throw domain::ConversionError(FailureKind::StorageError, "Failed to save upload: " + error);
    }

    m_dispatcher->convertTo(input.string(), output.string());

    std::string pdfBytes;
    if (!infrastructure::BinaryFile::Read(output.path(), pdfBytes, error)) {
        throw domain::ConversionError(FailureKind::StorageError, "Failed to read converted PDF: " + error);
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    std::cout << "[ConversionService] " << filename << " -> " << pdfName << " (" << pdfBytes.size()
              << " bytes, " << elapsed.count() << " ms)" << std::endl;

    return ConversionResult::Success(std::move(pdfBytes), pdfName);
}

} // namespace docxpdf::application
