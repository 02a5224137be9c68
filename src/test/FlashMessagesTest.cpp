#include <cassert>
#include <iostream>
#include <string>

#include <httplib.h>

#include "app/FlashMessages.hpp"

using docxpdf::app::FlashMessages;

int main() {
    std::cout << "[Test] Starting FlashMessages Test..." << std::endl;

    assert(FlashMessages::PercentDecode(FlashMessages::PercentEncode("a b;c=d\n%")) == "a b;c=d\n%");
    assert(FlashMessages::PercentEncode("x y") == "x%20y");
    assert(FlashMessages::CookieValue("theme=dark; flash=abc", "flash") == "abc");
    assert(FlashMessages::CookieValue("theme=dark", "flash").empty());
    std::cout << "[PASS] Encoding and cookie parsing." << std::endl;

    // Short messages survive a push/take cycle untouched
    {
        httplib::Response redirect;
        FlashMessages::Push(redirect, "Error converting file: bad input");
        std::string setCookie = redirect.get_header_value("Set-Cookie");

        httplib::Request next;
        next.set_header("Cookie", setCookie.substr(0, setCookie.find(';')));
        httplib::Response page;
        auto messages = FlashMessages::Take(next, page);
        assert(messages.size() == 1);
        assert(messages[0] == "Error converting file: bad input");
        assert(page.get_header_value("Set-Cookie").find("Max-Age=0") != std::string::npos);
    }
    std::cout << "[PASS] Push then Take." << std::endl;

    // Long engine diagnostics are cut so the cookie stays under browser limits
    {
        std::string diagnostics = "Error converting file: " + std::string(20000, '#');
        httplib::Response redirect;
        FlashMessages::Push(redirect, diagnostics);
        std::string setCookie = redirect.get_header_value("Set-Cookie");
        assert(setCookie.size() < 4096);

        std::string shown = FlashMessages::PercentDecode(FlashMessages::CookieValue(setCookie, "flash"));
        assert(shown.size() == 1000);
        assert(shown.rfind("Error converting file: ###", 0) == 0);
        assert(shown.substr(shown.size() - 3) == "...");
        assert(FlashMessages::Truncate("short") == "short");
    }
    std::cout << "[PASS] Long messages truncated." << std::endl;

    std::cout << "[PASS] FlashMessages Test." << std::endl;
    return 0;
}
