/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading the service configuration (dockbuild.json).
 *
 * Every key is optional; anything missing or unreadable keeps its default
 * so the service can always start.
 */

#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <nlohmann/json.hpp>
#include "domain/ProjectType.hpp"
#include "infrastructure/DockerClient.hpp"

namespace dockbuild::infrastructure {

/**
 * @struct AppConfig
 * @brief Resolved settings for one process.
 */
struct AppConfig {
    std::string serverHost = "0.0.0.0";
    int serverPort = 8080;
    std::size_t maxUploadBytes = 100 * 1024 * 1024;
    std::string tempDir = "./temp_builds";
    DockerEndpoint docker;
    std::map<domain::ProjectType, std::string> imageOverrides;
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings from a JSON file.
     * @param configPath Path to the file; a missing file yields defaults.
     */
    static AppConfig Load(const std::string& configPath);

    /** @brief Builds a config from already parsed JSON, keeping defaults for bad keys. */
    static AppConfig FromJson(const nlohmann::json& j);

    /** @brief Applies DOCKER_HOST from the process environment, if set. */
    static void ApplyEnvironment(AppConfig& config);

    /**
     * @brief Points the Docker endpoint at a DOCKER_HOST-style URL.
     * @param value "unix:///path" or "tcp://host:port".
     * @return False (config untouched) when the scheme is not supported.
     */
    static bool ApplyDockerHost(AppConfig& config, const std::string& value);
};

} // namespace dockbuild::infrastructure
