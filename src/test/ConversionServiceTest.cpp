#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include "application/ConversionService.hpp"
#include "infrastructure/HeadlessOfficeBackend.hpp"
#include "test/TestSupport.hpp"

using namespace docxpdf;
using namespace std::chrono_literals;
using docxpdf::test::FakeOfficeMode;
namespace fs = std::filesystem;

namespace {

struct Fixture {
    fs::path root;
    fs::path bin;
    fs::path temp;
    fs::path script;
    std::shared_ptr<application::ConversionService> service;

    Fixture(FakeOfficeMode mode, std::chrono::milliseconds timeout = 10000ms) {
        root = docxpdf::test::MakeScratchDir("service");
        bin = root / "bin";
        temp = root / "tmp";
        fs::create_directories(bin);

        script = docxpdf::test::WriteFakeOffice(bin, mode);

        domain::ServiceConfig config;
        config.tempDir = temp.string();
        auto backend = std::make_shared<infrastructure::HeadlessOfficeBackend>(script.string(), timeout);
        auto dispatcher = std::make_shared<application::ConversionDispatcher>(backend, config.tempDir);
        service = std::make_shared<application::ConversionService>(dispatcher, config);
    }

    ~Fixture() { fs::remove_all(root); }

    size_t leftovers() const { return docxpdf::test::CountEntries(temp); }
    size_t engineCalls() const { return docxpdf::test::FakeOfficeCalls(script); }
};

domain::ConversionRequest Upload(const std::string& filename, const std::string& bytes = "PK\x03\x04 body") {
    domain::ConversionRequest r;
    r.hasFile = true;
    r.originalFilename = filename;
    r.sourceBytes = bytes;
    return r;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ConversionService Test..." << std::endl;

    {
        Fixture f(FakeOfficeMode::Render);
        assert(f.service->tempDir() == f.temp);

        domain::ConversionRequest none;
        auto r = f.service->convert(none);
        assert(!r.isSuccess());
        assert(r.kind() == domain::FailureKind::MissingFile);
        assert(r.message() == "No file provided");

        r = f.service->convert(Upload(""));
        assert(r.kind() == domain::FailureKind::EmptyFilename);

        for (const char* name : {"notes.txt", "NOTES.TXT", "report.docx.txt", "report.doc", "docx"}) {
            r = f.service->convert(Upload(name));
            assert(!r.isSuccess());
            assert(r.kind() == domain::FailureKind::InvalidExtension);
            assert(r.message().find("Invalid file type") != std::string::npos);
        }

        r = f.service->convert(Upload("../.docx"));
        assert(r.kind() == domain::FailureKind::InvalidFilename);

        assert(f.leftovers() == 0);
        assert(f.engineCalls() == 0);
        std::cout << "[PASS] Rejected uploads never touch disk or the engine." << std::endl;
    }

    {
        Fixture f(FakeOfficeMode::Render);
        auto r = f.service->convert(Upload("Report.DOCX", "hello docx"));
        assert(r.isSuccess());
        assert(r.outputFilename() == "Report.pdf");
        assert(r.outputBytes().rfind("%PDF-1.4", 0) == 0);
        assert(r.outputBytes().find("hello docx") != std::string::npos);
        assert(f.leftovers() == 0);
        std::cout << "[PASS] Success keeps the stem and cleans up." << std::endl;

        r = f.service->convert(Upload("my report (final).docx"));
        assert(r.isSuccess());
        assert(r.outputFilename() == "my_report_final.pdf");

        // Names near NAME_MAX still convert; only the temp copy is shortened
        std::string longStem(230, 'a');
        r = f.service->convert(Upload(longStem + ".docx", "long name body"));
        assert(r.isSuccess());
        assert(r.outputFilename() == longStem + ".pdf");
        assert(r.outputBytes().find("long name body") != std::string::npos);
        assert(f.leftovers() == 0);
        std::cout << "[PASS] Long filenames convert under their full name." << std::endl;

        assert(f.service->convert(Upload("Report.docx")).isSuccess());
        assert(f.service->convert(Upload("Report.docx")).isSuccess());
        assert(f.leftovers() == 0);
        std::cout << "[PASS] Sequential conversions both succeed." << std::endl;

        // Identical names from concurrent callers must not share temp files
        const int kCallers = 8;
        std::vector<std::thread> threads;
        std::atomic<int> isolated{0};
        for (int i = 0; i < kCallers; ++i) {
            threads.emplace_back([&f, &isolated, i]() {
                std::string marker = "caller-" + std::to_string(i) + "-payload";
                auto result = f.service->convert(Upload("same.docx", marker));
                if (result.isSuccess() && result.outputBytes().find(marker) != std::string::npos) {
                    ++isolated;
                }
            });
        }
        for (auto& t : threads) t.join();
        assert(isolated == kCallers);
        assert(f.leftovers() == 0);
        std::cout << "[PASS] Concurrent identical filenames stay isolated." << std::endl;
    }

    {
        Fixture f(FakeOfficeMode::Fail);
        auto r = f.service->convert(Upload("broken.docx"));
        assert(!r.isSuccess());
        assert(r.kind() == domain::FailureKind::ConversionEngineError);
        assert(!domain::IsClientError(r.kind()));
        assert(r.message().find("could not be loaded") != std::string::npos);
        assert(f.leftovers() == 0);
        assert(f.engineCalls() == 1);
        std::cout << "[PASS] Engine failure cleans up." << std::endl;
    }

    {
        Fixture f(FakeOfficeMode::Silent);
        auto r = f.service->convert(Upload("ghost.docx"));
        assert(r.kind() == domain::FailureKind::OutputMissing);
        assert(f.leftovers() == 0);
        std::cout << "[PASS] Missing output cleans up." << std::endl;
    }

    {
        Fixture f(FakeOfficeMode::Hang, 500ms);
        auto r = f.service->convert(Upload("slow.docx"));
        assert(r.kind() == domain::FailureKind::ConversionTimeout);
        assert(r.message().find("timed out") != std::string::npos);
        assert(f.leftovers() == 0);
        std::cout << "[PASS] Timeout cleans up." << std::endl;
    }

    std::cout << "[PASS] ConversionService Test." << std::endl;
    return 0;
}
