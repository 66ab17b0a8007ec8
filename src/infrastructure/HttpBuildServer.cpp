#include "infrastructure/HttpBuildServer.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <exception>
#include <iostream>

namespace dockbuild::infrastructure {

using json = nlohmann::json;

namespace {

constexpr const char* kTextPlain = "text/plain";

std::string FieldValue(const httplib::Request& req, const std::string& name) {
    if (req.has_param(name)) {
        return req.get_param_value(name);
    }
    if (req.has_file(name)) {
        return req.get_file_value(name).content;
    }
    return {};
}

} // namespace

HttpBuildServer::HttpBuildServer(std::shared_ptr<application::ArchiveIntakeService> intake,
                                 std::shared_ptr<application::BuildService> buildService,
                                 std::size_t maxUploadBytes)
    : m_server(std::make_unique<httplib::Server>()),
      m_intake(std::move(intake)),
      m_buildService(std::move(buildService)) {
    m_server->set_payload_max_length(maxUploadBytes);
    m_server->set_logger([](const httplib::Request& req, const httplib::Response& res) {
        std::cout << "[HttpBuildServer] " << req.method << " " << req.path << " -> " << res.status << std::endl;
    });
    registerRoutes();
}

HttpBuildServer::~HttpBuildServer() = default;

void HttpBuildServer::registerRoutes() {
    m_server->Post("/api/simple/build-sync", [this](const httplib::Request& req, httplib::Response& res) {
        application::UploadRequest upload;
        if (req.has_file("file")) {
            const auto& file = req.get_file_value("file");
            upload.originalFilename = file.filename;
            upload.content = file.content;
        }
        upload.projectType = FieldValue(req, "projectType");

        auto response = m_intake->handleUpload(upload);
        res.status = response.status;
        res.set_content(response.body, kTextPlain);
    });

    m_server->Get("/api/simple/project-types", [this](const httplib::Request&, httplib::Response& res) {
        res.set_content(ProjectTypesJson(m_buildService->catalog()), "application/json");
    });

    m_server->Get("/api/simple/health", [](const httplib::Request&, httplib::Response& res) {
        res.set_content("OK", kTextPlain);
    });

    m_server->set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string detail;
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            detail = e.what();
        } catch (...) {
            detail = "unknown error";
        }
        std::cerr << "[HttpBuildServer] Unhandled error on " << req.path << ": " << detail << std::endl;
        res.status = 500;
        res.set_content("Unexpected build error: " + detail, kTextPlain);
    });
}

bool HttpBuildServer::listen(const std::string& host, int port) {
    std::cout << "[HttpBuildServer] Listening on " << host << ":" << port << std::endl;
    return m_server->listen(host, port);
}

void HttpBuildServer::stop() {
    m_server->stop();
}

std::string HttpBuildServer::ProjectTypesJson(const domain::BuildProfileCatalog& catalog) {
    json out = json::array();
    for (const auto& profile : catalog.all()) {
        out.push_back({
            {"projectType", domain::ProjectTypeToString(profile.projectType)},
            {"image", profile.imageReference},
            {"markerFile", profile.markerFile}
        });
    }
    return out.dump();
}

} // namespace dockbuild::infrastructure
