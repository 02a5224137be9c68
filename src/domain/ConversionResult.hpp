/**
 * @file ConversionResult.hpp
 * @brief Outcome types shared by the dispatcher, the conversion service and the HTTP layer.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace docxpdf::domain {

/**
 * @enum FailureKind
 * @brief Classification of everything that can go wrong while serving one conversion.
 */
enum class FailureKind {
    MissingFile,
    EmptyFilename,
    InvalidExtension,
    InvalidFilename,
    InputNotFound,
    ConversionTimeout,
    ConversionEngineError,
    OutputMissing,
    StorageError
};

/** @brief True for failures caused by the client's input (reported as 4xx). */
inline bool IsClientError(FailureKind kind) {
    switch (kind) {
        case FailureKind::MissingFile:
        case FailureKind::EmptyFilename:
        case FailureKind::InvalidExtension:
        case FailureKind::InvalidFilename:
            return true;
        default:
            return false;
    }
}

inline const char* ToString(FailureKind kind) {
    switch (kind) {
        case FailureKind::MissingFile: return "MissingFile";
        case FailureKind::EmptyFilename: return "EmptyFilename";
        case FailureKind::InvalidExtension: return "InvalidExtension";
        case FailureKind::InvalidFilename: return "InvalidFilename";
        case FailureKind::InputNotFound: return "InputNotFound";
        case FailureKind::ConversionTimeout: return "ConversionTimeout";
        case FailureKind::ConversionEngineError: return "ConversionEngineError";
        case FailureKind::OutputMissing: return "OutputMissing";
        case FailureKind::StorageError: return "StorageError";
    }
    return "Unknown";
}

/**
 * @class ConversionError
 * @brief Raised by converter backends and the dispatcher. Carries the failure class.
 */
class ConversionError : public std::runtime_error {
public:
    ConversionError(FailureKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    FailureKind kind() const { return m_kind; }

private:
    FailureKind m_kind;
};

/**
 * @class ConversionResult
 * @brief Either a rendered PDF (bytes + download name) or a classified failure.
 */
class ConversionResult {
public:
    static ConversionResult Success(std::string outputBytes, std::string outputFilename) {
        ConversionResult r;
        r.m_success = true;
        r.m_outputBytes = std::move(outputBytes);
        r.m_outputFilename = std::move(outputFilename);
        return r;
    }

    static ConversionResult Failure(FailureKind kind, std::string message) {
        ConversionResult r;
        r.m_success = false;
        r.m_kind = kind;
        r.m_message = std::move(message);
        return r;
    }

    bool isSuccess() const { return m_success; }

    const std::string& outputBytes() const { return m_outputBytes; }
    const std::string& outputFilename() const { return m_outputFilename; }

    /** @brief Only meaningful when !isSuccess(). */
    FailureKind kind() const { return m_kind; }
    const std::string& message() const { return m_message; }

private:
    ConversionResult() = default;

    bool m_success = false;
    std::string m_outputBytes;
    std::string m_outputFilename;
    FailureKind m_kind = FailureKind::ConversionEngineError;
    std::string m_message;
};

} // namespace docxpdf::domain
