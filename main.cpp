#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "app/ConverterHttpServer.hpp"
#include "application/ConversionDispatcher.hpp"
#include "application/ConversionService.hpp"
#include "infrastructure/BackendSelector.hpp"
#include "infrastructure/ConfigLoader.hpp"

using namespace docxpdf;

int main(int argc, char** argv) {
    try {
        std::optional<std::string> settingsPath;
        if (argc > 1) {
            settingsPath = argv[1];
        }

        std::cout << "========================================" << std::endl;
        std::cout << "DOCX to PDF Conversion Service" << std::endl;
        std::cout << "========================================" << std::endl;

        // Composition root: configuration and backend are decided once, here.
        const domain::ServiceConfig config = infrastructure::ConfigLoader::Load(settingsPath);
        std::shared_ptr<domain::ConverterBackend> backend = infrastructure::BackendSelector::Select(config);

        auto dispatcher = std::make_shared<application::ConversionDispatcher>(backend, config.tempDir);
        auto service = std::make_shared<application::ConversionService>(dispatcher, config);

        app::ConverterHttpServer server(config, service);
        return server.Run();
    } catch (const std::exception& e) {
        std::cerr << "[FATAL] " << e.what() << std::endl;
        return 1;
    }
}
