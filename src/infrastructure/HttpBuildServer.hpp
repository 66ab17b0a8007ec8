/**
 * @file HttpBuildServer.hpp
 * @brief HTTP front end for synchronous builds.
 */

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include "application/ArchiveIntakeService.hpp"
#include "application/BuildService.hpp"

namespace httplib {
class Server;
}

namespace dockbuild::infrastructure {

/**
 * @class HttpBuildServer
 * @brief Routes:
 *  - POST /api/simple/build-sync   multipart "file" + "projectType", blocks until the build ends
 *  - GET  /api/simple/project-types
 *  - GET  /api/simple/health
 */
class HttpBuildServer {
public:
    HttpBuildServer(std::shared_ptr<application::ArchiveIntakeService> intake,
                    std::shared_ptr<application::BuildService> buildService,
                    std::size_t maxUploadBytes);
    ~HttpBuildServer();

    /** @brief Blocks serving requests; false if the socket could not be bound. */
    bool listen(const std::string& host, int port);

    void stop();

    /** @brief JSON array describing each supported profile. */
    static std::string ProjectTypesJson(const domain::BuildProfileCatalog& catalog);

private:
    void registerRoutes();

    std::unique_ptr<httplib::Server> m_server;
    std::shared_ptr<application::ArchiveIntakeService> m_intake;
    std::shared_ptr<application::BuildService> m_buildService;
};

} // namespace dockbuild::infrastructure
