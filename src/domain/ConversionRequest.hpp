/**
 * @file ConversionRequest.hpp
 * @brief Transient value describing one uploaded document.
 */

#pragma once
#include <string>

namespace docxpdf::domain {

/**
 * @struct ConversionRequest
 * @brief What the transport handed over: whether a file field was present, its name and its bytes.
 */
struct ConversionRequest {
    bool hasFile = false;
    std::string originalFilename;
    std::string sourceBytes;
};

} // namespace docxpdf::domain
