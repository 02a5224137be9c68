/**
 * @file ConverterHttpServer.hpp
 * @brief HTTP surface of the converter: upload form, interactive and API conversion, health probe.
 */

#pragma once

#include <memory>
#include <string>

#include "application/ConversionService.hpp"
#include "domain/ServiceConfig.hpp"

namespace httplib {
class Server;
struct Request;
struct Response;
}

namespace docxpdf::app {

/**
 * @class ConverterHttpServer
 * @brief Maps HTTP requests onto ConversionService and its results onto responses.
 *
 * Interactive failures redirect to "/" with a flash message; API failures return
 * {"error": ...} with 400 for bad input and 500 for conversion problems.
 * Bodies above ServiceConfig::maxUploadBytes are refused with 413 before any handler runs.
 */
class ConverterHttpServer {
public:
    ConverterHttpServer(domain::ServiceConfig config, std::shared_ptr<application::ConversionService> service);
    ~ConverterHttpServer();

    ConverterHttpServer(const ConverterHttpServer&) = delete;
    ConverterHttpServer& operator=(const ConverterHttpServer&) = delete;

    /**
     * @brief Listens on the configured host and port until Stop().
     * @return Exit code (0 for a clean stop).
     */
    int Run();

    /** @brief Binds an ephemeral port and returns it (-1 on failure). Pair with ListenAfterBind(). */
    int BindToAnyPort(const std::string& host = "127.0.0.1");
    bool ListenAfterBind();

    void Stop();
    bool IsRunning() const;

private:
    void RegisterRoutes();

    void HandleIndex(const httplib::Request& req, httplib::Response& res);
    void HandleHealth(const httplib::Request& req, httplib::Response& res);
    void HandleInteractiveConvert(const httplib::Request& req, httplib::Response& res);
    void HandleApiConvert(const httplib::Request& req, httplib::Response& res);

    domain::ServiceConfig m_config;
    std::shared_ptr<application::ConversionService> m_service;
    std::unique_ptr<httplib::Server> m_server;
};

} // namespace docxpdf::app
