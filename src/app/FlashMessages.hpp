/**
 * @file FlashMessages.hpp
 * @brief One-shot status messages carried across a redirect in a cookie.
 */

#pragma once

#include <string>
#include <vector>

namespace httplib {
struct Request;
struct Response;
}

namespace docxpdf::app {

class FlashMessages {
public:
    static constexpr const char* kCookieName = "flash";

    /** @brief Sets the flash cookie on a (redirect) response. Long messages are cut, see Truncate(). */
    static void Push(httplib::Response& res, const std::string& message);

    /** @brief Returns pending messages and expires the cookie. */
    static std::vector<std::string> Take(const httplib::Request& req, httplib::Response& res);

    /** @brief Caps a message at 1000 bytes, marking the cut with "...". */
    static std::string Truncate(const std::string& message);

    static std::string PercentEncode(const std::string& value);
    static std::string PercentDecode(const std::string& value);

    /** @brief Extracts one cookie value from a Cookie header ("a=1; flash=x"). */
    static std::string CookieValue(const std::string& cookieHeader, const std::string& name);
};

} // namespace docxpdf::app
