// Command-line front end: converts one document with the same backend selection as the server.
#include <iostream>
#include <optional>
#include <string>

#include "application/ConversionDispatcher.hpp"
#include "domain/ConversionResult.hpp"
#include "infrastructure/BackendSelector.hpp"
#include "infrastructure/ConfigLoader.hpp"

using namespace docxpdf;

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <input.docx> [output_dir]" << std::endl;
        return 1;
    }

    std::string inputFile = argv[1];
    std::optional<std::string> outputDir;
    if (argc > 2) {
        outputDir = argv[2];
    }

    try {
        auto config = infrastructure::ConfigLoader::Load();
        application::ConversionDispatcher dispatcher(infrastructure::BackendSelector::Select(config), config.tempDir);

        std::string pdfPath = dispatcher.convert(inputFile, outputDir);
        std::cout << "Successfully converted to: " << pdfPath << std::endl;
        return 0;
    } catch (const domain::ConversionError& e) {
        std::cerr << "Error (" << domain::ToString(e.kind()) << "): " << e.what() << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
    }
    return 1;
}
