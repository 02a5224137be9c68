#include "app/UploadPage.hpp"

#include <sstream>

namespace docxpdf::app {

namespace {

const char* kPageHead = R"(<!DOCTYPE html>
<html lang="en">
<head>
<meta charset="utf-8">
<title>DOCX to PDF Converter</title>
<style>
body { font-family: sans-serif; max-width: 560px; margin: 60px auto; color: #222; }
.card { border: 1px solid #ddd; border-radius: 8px; padding: 24px; }
.flash { background: #fdecea; border: 1px solid #f5c6cb; color: #8a1c1c; padding: 10px; border-radius: 4px; margin-bottom: 16px; }
button { margin-top: 16px; padding: 8px 20px; }
small { color: #777; }
</style>
</head>
<body>
<div class="card">
<h1>DOCX to PDF Converter</h1>
)";

const char* kPageTail = R"(<form method="post" action="/convert" enctype="multipart/form-data">
<input type="file" name="file" accept=".docx">
<br>
<button type="submit">Convert to PDF</button>
</form>
)";

} // namespace

std::string HtmlEscape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default: out.push_back(c);
        }
    }
    return out;
}

std::string RenderUploadPage(const std::vector<std::string>& messages, std::size_t maxUploadBytes) {
    std::ostringstream html;
    html << kPageHead;
    for (const auto& message : messages) {
        html << "<div class=\"flash\">" << HtmlEscape(message) << "</div>\n";
    }
    html << kPageTail;
    html << "<p><small>Only .docx files, up to " << (maxUploadBytes / (1024 * 1024)) << " MB.</small></p>\n";
    html << "</div>\n</body>\n</html>\n";
    return html.str();
}

} // namespace docxpdf::app
