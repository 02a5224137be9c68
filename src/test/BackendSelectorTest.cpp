#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include "domain/ConversionResult.hpp"
#include "infrastructure/BackendSelector.hpp"
#include "infrastructure/PathUtils.hpp"
#include "test/TestSupport.hpp"

using namespace docxpdf;
using docxpdf::infrastructure::BackendSelector;
using docxpdf::test::FakeOfficeMode;
namespace fs = std::filesystem;

namespace {

// Runs one conversion and reports whether the expected PDF appeared.
bool ConvertsWith(domain::ConverterBackend& backend, const fs::path& root) {
    fs::path input = root / "in.docx";
    docxpdf::test::WriteText(input, "PK\x03\x04 selector");
    fs::path output = root / "out" / "in.pdf";
    std::string produced = backend.convert(input.string(), output.string());
    bool ok = fs::exists(produced);
    fs::remove_all(root / "out");
    return ok;
}

} // namespace

int main() {
    std::cout << "[Test] Starting BackendSelector Test..." << std::endl;

    fs::path root = docxpdf::test::MakeScratchDir("backend_selector");
    fs::path bin = root / "bin";
    fs::create_directories(bin);

    const char* oldPath = std::getenv("PATH");
    std::string savedPath = oldPath ? oldPath : "";
    // The scratch bin comes first; the rest of PATH stays for the tools the fake script uses.
    ::setenv("PATH", (bin.string() + ":" + savedPath).c_str(), 1);

    // 1. Explicit Word automation off Windows is a startup error
    {
        domain::ServiceConfig config;
        config.backend = domain::BackendKind::WordAutomation;
        bool threw = false;
        try {
            BackendSelector::Select(config);
        } catch (const std::runtime_error& e) {
            threw = std::string(e.what()).find("Word") != std::string::npos;
        }
        assert(threw);
        std::cout << "[PASS] Explicit word backend without Word fails at startup." << std::endl;
    }

    // 2. Auto falls back to the headless office; a missing configured name falls back to soffice
    {
        fs::path soffice = docxpdf::test::WriteFakeOffice(bin, FakeOfficeMode::Render, "soffice");

        domain::ServiceConfig config;
        config.backend = domain::BackendKind::Auto;
        config.officeExecutable = "docxpdf-test-office-not-installed";
        auto backend = BackendSelector::Select(config);
        assert(backend->name() == "libreoffice");
        assert(ConvertsWith(*backend, root));
        assert(docxpdf::test::FakeOfficeCalls(soffice) == 1);
        std::cout << "[PASS] Auto selects the headless office and falls back to soffice." << std::endl;
    }

    // 3. A configured name that is on PATH wins over soffice
    {
        fs::path preferred = docxpdf::test::WriteFakeOffice(bin, FakeOfficeMode::Render, "docxpdf-test-office");
        fs::path soffice = docxpdf::test::WriteFakeOffice(bin, FakeOfficeMode::Render, "soffice");

        domain::ServiceConfig config;
        config.backend = domain::BackendKind::HeadlessOffice;
        config.officeExecutable = "docxpdf-test-office";
        auto backend = BackendSelector::Select(config);
        assert(backend->name() == "libreoffice");
        assert(ConvertsWith(*backend, root));
        assert(docxpdf::test::FakeOfficeCalls(preferred) == 1);
        assert(docxpdf::test::FakeOfficeCalls(soffice) == 0);

        // An absolute path is used as given
        config.officeExecutable = preferred.string();
        auto direct = BackendSelector::Select(config);
        assert(ConvertsWith(*direct, root));
        assert(docxpdf::test::FakeOfficeCalls(preferred) == 2);
        std::cout << "[PASS] Configured executable preferred over soffice." << std::endl;
    }

    // 4. Nothing installed: selection still succeeds and conversions report the engine error
    fs::remove_all(bin);
    fs::create_directories(bin);
    if (!infrastructure::PathUtils::FindExecutable("soffice")) {
        domain::ServiceConfig config;
        config.officeExecutable = "docxpdf-test-office-not-installed";
        auto backend = BackendSelector::Select(config);
        bool engineError = false;
        try {
            ConvertsWith(*backend, root);
        } catch (const domain::ConversionError& e) {
            engineError = e.kind() == domain::FailureKind::ConversionEngineError;
        }
        assert(engineError);
        std::cout << "[PASS] Missing office executable surfaces as an engine error." << std::endl;
    } else {
        std::cout << "[SKIP] A real soffice is installed; missing-executable case not checked." << std::endl;
    }

    ::setenv("PATH", savedPath.c_str(), 1);
    fs::remove_all(root);
    std::cout << "[PASS] BackendSelector Test." << std::endl;
    return 0;
}
