/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace dockbuild::infrastructure {

namespace {

template <typename T>
void ReadValue(const nlohmann::json& section, const char* key, T& out) {
    if (!section.is_object() || !section.contains(key)) return;
    try {
        out = section.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': " << e.what() << std::endl;
    }
}

const nlohmann::json& Section(const nlohmann::json& j, const char* key) {
    static const nlohmann::json empty = nlohmann::json::object();
    if (j.is_object() && j.contains(key) && j.at(key).is_object()) {
        return j.at(key);
    }
    return empty;
}

} // namespace

AppConfig ConfigLoader::Load(const std::string& configPath) {
    if (!std::filesystem::exists(configPath)) {
        std::cout << "[ConfigLoader] No " << configPath << " found, using defaults." << std::endl;
        return AppConfig{};
    }

    try {
        std::ifstream f(configPath);
        nlohmann::json j;
        f >> j;
        std::cout << "[ConfigLoader] Loaded " << configPath << std::endl;
        return FromJson(j);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << configPath << ": " << e.what() << std::endl;
    }
    return AppConfig{};
}

AppConfig ConfigLoader::FromJson(const nlohmann::json& j) {
    AppConfig config;

    const auto& server = Section(j, "server");
    ReadValue(server, "host", config.serverHost);
    ReadValue(server, "port", config.serverPort);
    ReadValue(server, "max_upload_bytes", config.maxUploadBytes);

    ReadValue(j, "temp_dir", config.tempDir);

    const auto& docker = Section(j, "docker");
    ReadValue(docker, "socket", config.docker.socketPath);
    ReadValue(docker, "host", config.docker.host);
    ReadValue(docker, "port", config.docker.port);
    ReadValue(docker, "api_version", config.docker.apiVersion);
    ReadValue(docker, "read_timeout_seconds", config.docker.readTimeoutSeconds);

    const auto& images = Section(j, "images");
    for (const auto& [key, value] : images.items()) {
        auto type = domain::ParseProjectType(key);
        if (!type) {
            std::cerr << "[ConfigLoader] Ignoring image for unknown project type: " << key << std::endl;
            continue;
        }
        if (!value.is_string() || value.get<std::string>().empty()) {
            std::cerr << "[ConfigLoader] Ignoring image for " << key << ": expected a non-empty string" << std::endl;
            continue;
        }
        config.imageOverrides[*type] = value.get<std::string>();
    }

    return config;
}

void ConfigLoader::ApplyEnvironment(AppConfig& config) {
    const char* dockerHost = std::getenv("DOCKER_HOST");
    if (dockerHost && *dockerHost) {
        if (!ApplyDockerHost(config, dockerHost)) {
            std::cerr << "[ConfigLoader] Unsupported DOCKER_HOST: " << dockerHost << std::endl;
        }
    }
}

bool ConfigLoader::ApplyDockerHost(AppConfig& config, const std::string& value) {
    const std::string unixScheme = "unix://";
    const std::string tcpScheme = "tcp://";

    if (value.rfind(unixScheme, 0) == 0) {
        std::string path = value.substr(unixScheme.size());
        if (path.empty()) return false;
        config.docker.socketPath = path;
        config.docker.host.clear();
        return true;
    }

    if (value.rfind(tcpScheme, 0) == 0) {
        std::string hostPort = value.substr(tcpScheme.size());
        auto colon = hostPort.rfind(':');
        std::string host = hostPort.substr(0, colon);
        int port = 2375;
        if (colon != std::string::npos) {
            try {
                port = std::stoi(hostPort.substr(colon + 1));
            } catch (const std::exception&) {
                return false;
            }
        }
        if (host.empty()) return false;
        config.docker.host = host;
        config.docker.port = port;
        return true;
    }

    return false;
}

} // namespace dockbuild::infrastructure
