#include "domain/UploadPolicy.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>

namespace docxpdf::domain {

namespace {

const std::array<const char*, 1> kAllowedExtensions = {"docx"};

#if defined(_WIN32)
const std::array<const char*, 22> kWindowsDeviceNames = {
    "CON", "PRN", "AUX", "NUL",
    "COM1", "COM2", "COM3", "COM4", "COM5", "COM6", "COM7", "COM8", "COM9",
    "LPT1", "LPT2", "LPT3", "LPT4", "LPT5", "LPT6", "LPT7", "LPT8", "LPT9"
};
#endif

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

#if defined(_WIN32)
std::string ToUpper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::toupper(c); });
    return s;
}
#endif

bool IsSafeChar(unsigned char c) {
    return std::isalnum(c) || c == '_' || c == '.' || c == '-';
}

} // namespace

bool UploadPolicy::IsAllowedFile(const std::string& filename) {
    auto dot = filename.rfind('.');
    if (dot == std::string::npos) {
        return false;
    }
    std::string ext = ToLower(filename.substr(dot + 1));
    return std::any_of(kAllowedExtensions.begin(), kAllowedExtensions.end(),
                       [&ext](const char* allowed) { return ext == allowed; });
}

std::string UploadPolicy::SecureFilename(const std::string& filename) {
    std::string ascii;
    ascii.reserve(filename.size());
    for (unsigned char c : filename) {
        if (c >= 0x80) continue;
        ascii.push_back((c == '/' || c == '\\') ? ' ' : static_cast<char>(c));
    }

    // Collapse whitespace runs into single underscores.
    std::istringstream words(ascii);
    std::string word;
    std::string joined;
    while (words >> word) {
        if (!joined.empty()) joined.push_back('_');
        joined += word;
    }

    std::string safe;
    for (unsigned char c : joined) {
        if (IsSafeChar(c)) safe.push_back(static_cast<char>(c));
    }

    auto first = safe.find_first_not_of("._");
    if (first == std::string::npos) {
        return {};
    }
    auto last = safe.find_last_not_of("._");
    safe = safe.substr(first, last - first + 1);

#if defined(_WIN32)
    std::string base = ToUpper(safe.substr(0, safe.find('.')));
    if (std::find(kWindowsDeviceNames.begin(), kWindowsDeviceNames.end(), base) != kWindowsDeviceNames.end()) {
        safe = "_" + safe;
    }
#endif
    return safe;
}

std::string UploadPolicy::PdfNameFor(const std::string& filename) {
    auto dot = filename.rfind('.');
    std::string stem = (dot == std::string::npos || dot == 0) ? filename : filename.substr(0, dot);
    return stem + ".pdf";
}

std::optional<FailureKind> UploadPolicy::Validate(const ConversionRequest& request) {
    if (!request.hasFile) {
        return FailureKind::MissingFile;
    }
    if (request.originalFilename.empty()) {
        return FailureKind::EmptyFilename;
    }
    if (!IsAllowedFile(request.originalFilename)) {
        return FailureKind::InvalidExtension;
    }

    // "../.docx" passes the extension check but sanitizes to "docx".
    std::string secured = SecureFilename(request.originalFilename);
    if (secured.empty() || !IsAllowedFile(secured)) {
        return FailureKind::InvalidFilename;
    }
    return std::nullopt;
}

} // namespace docxpdf::domain
