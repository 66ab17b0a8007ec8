#include <iostream>
#include <memory>
#include <string>

#include "application/ArchiveIntakeService.hpp"
#include "application/BuildService.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/DockerClient.hpp"
#include "infrastructure/DockerEnvironment.hpp"
#include "infrastructure/HttpBuildServer.hpp"

using namespace dockbuild;

int main(int argc, char** argv) {
    const std::string configPath = argc > 1 ? argv[1] : "dockbuild.json";

    auto config = infrastructure::ConfigLoader::Load(configPath);
    infrastructure::ConfigLoader::ApplyEnvironment(config);

    auto docker = std::make_shared<infrastructure::DockerClient>(config.docker);
    if (docker->ping()) {
        std::cout << "[Main] Docker daemon reachable at " << config.docker.describe() << std::endl;
    } else {
        std::cerr << "[Main] Docker daemon not reachable at " << config.docker.describe()
                  << ". Builds will fail until it is." << std::endl;
    }

    auto provider = std::make_shared<infrastructure::DockerEnvironmentProvider>(docker);
    auto buildService = std::make_shared<application::BuildService>(
        provider, domain::BuildProfileCatalog(config.imageOverrides));
    auto intake = std::make_shared<application::ArchiveIntakeService>(buildService, config.tempDir);

    infrastructure::HttpBuildServer server(intake, buildService, config.maxUploadBytes);
    if (!server.listen(config.serverHost, config.serverPort)) {
        std::cerr << "[Main] Could not listen on " << config.serverHost << ":" << config.serverPort << std::endl;
        return 1;
    }
    return 0;
}
