#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace docxpdf::app {

/** @brief Renders the upload form, showing any flash messages above it. */
std::string RenderUploadPage(const std::vector<std::string>& messages, std::size_t maxUploadBytes);

std::string HtmlEscape(const std::string& text);

} // namespace docxpdf::app
