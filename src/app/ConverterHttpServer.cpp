/**
 * @file ConverterHttpServer.cpp
 * @brief Implementation of the ConverterHttpServer class.
 */
#include "app/ConverterHttpServer.hpp"

#include "app/FlashMessages.hpp"
#include "app/UploadPage.hpp"
#include "domain/ConversionRequest.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace docxpdf::app {

using json = nlohmann::json;

namespace {

constexpr const char* kFileField = "file";

std::string UtcTimestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

domain::ConversionRequest ToConversionRequest(const httplib::Request& req) {
    domain::ConversionRequest request;
    if (req.is_multipart_form_data() && req.has_file(kFileField)) {
        const auto file = req.get_file_value(kFileField);
        request.hasFile = true;
        request.originalFilename = file.filename;
        request.sourceBytes = file.content;
    }
    return request;
}

void SendPdf(httplib::Response& res, const domain::ConversionResult& result) {
    res.status = 200;
    res.set_content(result.outputBytes(), "application/pdf");
    res.set_header("Content-Disposition", "attachment; filename=\"" + result.outputFilename() + "\"");
}

void SendJsonError(httplib::Response& res, int status, const std::string& message) {
    res.status = status;
    res.set_content(json({{"error", message}}).dump(), "application/json");
}

std::string InteractiveMessage(const domain::ConversionResult& result) {
    switch (result.kind()) {
        case domain::FailureKind::MissingFile:
            return "No file uploaded";
        case domain::FailureKind::EmptyFilename:
            return "No file selected";
        case domain::FailureKind::InvalidExtension:
        case domain::FailureKind::InvalidFilename:
            return "Invalid file type. Please upload a .docx file";
        default:
            return "Error converting file: " + result.message();
    }
}

} // namespace

ConverterHttpServer::ConverterHttpServer(domain::ServiceConfig config,
                                         std::shared_ptr<application::ConversionService> service)
    : m_config(std::move(config))
    , m_service(std::move(service))
    , m_server(std::make_unique<httplib::Server>()) {
    RegisterRoutes();
}

ConverterHttpServer::~ConverterHttpServer() {
    Stop();
}

void ConverterHttpServer::RegisterRoutes() {
    m_server->set_payload_max_length(m_config.maxUploadBytes);

    m_server->Get("/", [this](const httplib::Request& req, httplib::Response& res) { HandleIndex(req, res); });
    m_server->Get("/health", [this](const httplib::Request& req, httplib::Response& res) { HandleHealth(req, res); });
    m_server->Post("/convert", [this](const httplib::Request& req, httplib::Response& res) {
        HandleInteractiveConvert(req, res);
    });
    m_server->Post("/api/convert", [this](const httplib::Request& req, httplib::Response& res) {
        HandleApiConvert(req, res);
    });

    // Fills in bodies for transport-level errors (404, 413...). Handler-written bodies are left alone.
    m_server->set_error_handler([this](const httplib::Request& req, httplib::Response& res) {
        if (!res.body.empty()) return;

        std::string message;
        if (res.status == 413) {
            message = "File too large. Maximum size is " + std::to_string(m_config.maxUploadBytes / (1024 * 1024)) + " MB";
        } else if (res.status == 404) {
            message = "Not found";
        } else {
            message = "Request failed";
        }

        if (req.path.rfind("/api/", 0) == 0) {
            res.set_content(json({{"error", message}}).dump(), "application/json");
        } else {
            res.set_content(message, "text/plain");
        }
    });

    m_server->set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string message = "Internal server error";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            message = e.what();
        } catch (...) {
            message = "Unknown error";
        }
        std::cerr << "[HTTP] Unhandled error on " << req.method << " " << req.path << ": " << message << std::endl;
        SendJsonError(res, 500, message);
    });

    m_server->set_logger([](const httplib::Request& req, const httplib::Response& res) {
        std::cout << "[HTTP] " << req.method << " " << req.path << " -> " << res.status << std::endl;
    });
}

void ConverterHttpServer::HandleIndex(const httplib::Request& req, httplib::Response& res) {
    auto messages = FlashMessages::Take(req, res);
    res.set_content(RenderUploadPage(messages, m_config.maxUploadBytes), "text/html; charset=utf-8");
}

void ConverterHttpServer::HandleHealth(const httplib::Request&, httplib::Response& res) {
    json body = {
        {"status", "healthy"},
        {"service", m_config.serviceName},
        {"timestamp", UtcTimestamp()}
    };
    res.set_content(body.dump(), "application/json");
}

void ConverterHttpServer::HandleInteractiveConvert(const httplib::Request& req, httplib::Response& res) {
    auto result = m_service->convert(ToConversionRequest(req));
    if (result.isSuccess()) {
        SendPdf(res, result);
        return;
    }
    FlashMessages::Push(res, InteractiveMessage(result));
    res.set_redirect("/");
}

void ConverterHttpServer::HandleApiConvert(const httplib::Request& req, httplib::Response& res) {
    auto result = m_service->convert(ToConversionRequest(req));
    if (result.isSuccess()) {
        SendPdf(res, result);
        return;
    }
    SendJsonError(res, domain::IsClientError(result.kind()) ? 400 : 500, result.message());
}

int ConverterHttpServer::Run() {
    std::cout << "[SERVER] " << m_config.serviceName << " listening on " << m_config.host << ":" << m_config.port << std::endl;
    std::cout << "[SERVER] Endpoints:" << std::endl;
    std::cout << "  - GET  /" << std::endl;
    std::cout << "  - GET  /health" << std::endl;
    std::cout << "  - POST /convert" << std::endl;
    std::cout << "  - POST /api/convert" << std::endl;

    if (!m_server->listen(m_config.host, m_config.port)) {
        std::cerr << "[SERVER] Failed to listen on " << m_config.host << ":" << m_config.port << std::endl;
        return 1;
    }
    return 0;
}

int ConverterHttpServer::BindToAnyPort(const std::string& host) {
    return m_server->bind_to_any_port(host);
}

bool ConverterHttpServer::ListenAfterBind() {
    return m_server->listen_after_bind();
}

void ConverterHttpServer::Stop() {
    if (m_server && m_server->is_running()) {
        m_server->stop();
    }
}

bool ConverterHttpServer::IsRunning() const {
    return m_server->is_running();
}

} // namespace docxpdf::app
