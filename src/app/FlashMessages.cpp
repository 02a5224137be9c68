#include "app/FlashMessages.hpp"

#include <httplib.h>

#include <cctype>
#include <sstream>

namespace docxpdf::app {

namespace {

// Percent-encoding can triple this; the cookie must stay well under the ~4 KB browsers accept.
constexpr size_t kMaxMessageBytes = 1000;

int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string Trim(const std::string& s) {
    auto first = s.find_first_not_of(" \t");
    if (first == std::string::npos) return {};
    auto last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

} // namespace

std::string FlashMessages::PercentEncode(const std::string& value) {
    static const char* kHex = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

std::string FlashMessages::PercentDecode(const std::string& value) {
    std::string out;
    for (size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '%' && i + 2 < value.size()) {
            int hi = HexValue(value[i + 1]);
            int lo = HexValue(value[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(value[i]);
    }
    return out;
}

std::string FlashMessages::CookieValue(const std::string& cookieHeader, const std::string& name) {
    std::stringstream ss(cookieHeader);
    std::string pair;
    while (std::getline(ss, pair, ';')) {
        pair = Trim(pair);
        auto eq = pair.find('=');
        if (eq != std::string::npos && pair.substr(0, eq) == name) {
            return pair.substr(eq + 1);
        }
    }
    return {};
}

std::string FlashMessages::Truncate(const std::string& message) {
    if (message.size() <= kMaxMessageBytes) {
        return message;
    }
    return message.substr(0, kMaxMessageBytes - 3) + "...";
}

void FlashMessages::Push(httplib::Response& res, const std::string& message) {
    res.set_header("Set-Cookie", std::string(kCookieName) + "=" + PercentEncode(Truncate(message)) +
                                 "; Path=/; HttpOnly; SameSite=Lax");
}

std::vector<std::string> FlashMessages::Take(const httplib::Request& req, httplib::Response& res) {
    std::vector<std::string> messages;
    std::string raw = CookieValue(req.get_header_value("Cookie"), kCookieName);
    if (raw.empty()) {
        return messages;
    }

    std::stringstream ss(PercentDecode(raw));
    std::string line;
    while (std::getline(ss, line)) {
        if (!line.empty()) messages.push_back(line);
    }

    res.set_header("Set-Cookie", std::string(kCookieName) + "=; Path=/; Max-Age=0; HttpOnly; SameSite=Lax");
    return messages;
}

} // namespace docxpdf::app
