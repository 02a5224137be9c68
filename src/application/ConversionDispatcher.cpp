/**
 * @file ConversionDispatcher.cpp
 * @brief Implementation of ConversionDispatcher.
 */

#include "application/ConversionDispatcher.hpp"

#include "domain/ConversionResult.hpp"
#include "infrastructure/BinaryFile.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/TempArtifact.hpp"

#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace docxpdf::application {

using domain::ConversionError;
using domain::FailureKind;

namespace {

bool SamePath(const fs::path& a, const fs::path& b) {
    std::error_code ec;
    fs::path lhs = fs::absolute(a, ec).lexically_normal();
    fs::path rhs = fs::absolute(b, ec).lexically_normal();
    return lhs == rhs;
}

// rename() fails across filesystems; fall back to copy.
void MoveFile(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    fs::rename(from, to, ec);
    if (!ec) return;

    std::error_code copyEc;
    fs::copy_file(from, to, fs::copy_options::overwrite_existing, copyEc);
    if (copyEc) {
        throw ConversionError(FailureKind::StorageError,
                              "Failed to move " + from.string() + " to " + to.string() + ": " + copyEc.message());
    }
}

} // namespace

ConversionDispatcher::ConversionDispatcher(std::shared_ptr<domain::ConverterBackend> backend, std::string tempDir)
    : m_backend(std::move(backend)), m_tempDir(std::move(tempDir)) {}

std::string ConversionDispatcher::convert(const std::string& inputPath, const std::optional<std::string>& outputDir) {
    if (!fs::exists(inputPath)) {
        throw ConversionError(FailureKind::InputNotFound, "Input file not found: " + inputPath);
    }

    fs::path dir;
    if (outputDir) {
        dir = *outputDir;
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            throw ConversionError(FailureKind::StorageError,
                                  "Cannot create output directory " + dir.string() + ": " + ec.message());
        }
    } else {
        dir = fs::path(inputPath).parent_path();
    }

    fs::path pdfPath = dir / (fs::path(inputPath).stem().string() + ".pdf");
    return convertTo(inputPath, pdfPath.string());
}

std::string ConversionDispatcher::convertTo(const std::string& inputPath, const std::string& outputPath) {
    if (!fs::exists(inputPath)) {
        throw ConversionError(FailureKind::InputNotFound, "Input file not found: " + inputPath);
    }

    std::string produced;
    try {
        produced = m_backend->convert(inputPath, outputPath);
    } catch (const ConversionError&) {
        throw;
    } catch (const std::exception& e) {
        throw ConversionError(FailureKind::ConversionEngineError, m_backend->name() + " failed: " + e.what());
    }

    if (!fs::exists(produced)) {
        throw ConversionError(FailureKind::OutputMissing, "PDF file was not created: " + produced);
    }

    if (!SamePath(produced, outputPath)) {
        std::cout << "[Dispatcher] Moving " << produced << " -> " << outputPath << std::endl;
        infrastructure::TempArtifact strayOutput{fs::path(produced)};
        MoveFile(produced, outputPath);
    }

    if (!fs::exists(outputPath)) {
        throw ConversionError(FailureKind::OutputMissing, "PDF file was not created: " + outputPath);
    }
    return outputPath;
}

std::string ConversionDispatcher::convertToBytes(const std::string& inputPath) {
    if (!fs::exists(inputPath)) {
        throw ConversionError(FailureKind::InputNotFound, "Input file not found: " + inputPath);
    }

    infrastructure::TempArtifact scratch = [this]() {
        try {
            return infrastructure::TempArtifact::CreateDirectory(
                infrastructure::PathUtils::GetTempDir(m_tempDir), "docxpdf");
        } catch (const fs::filesystem_error& e) {
            throw ConversionError(FailureKind::StorageError, std::string("Cannot create scratch directory: ") + e.what());
        }
    }();

    std::string pdfPath = convert(inputPath, scratch.string());

    std::string bytes;
    std::string error;
    if (!infrastructure::BinaryFile::Read(pdfPath, bytes, error)) {
        throw ConversionError(FailureKind::StorageError, error);
    }
    return bytes;
}

} // namespace docxpdf::application
