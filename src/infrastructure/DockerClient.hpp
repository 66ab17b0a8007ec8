/**
 * @file DockerClient.hpp
 * @brief Low-level HTTP client for the Docker Engine REST API.
 */

#pragma once

#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace dockbuild::infrastructure {

/**
 * @struct DockerEndpoint
 * @brief Where the daemon listens. A non-empty host selects TCP, otherwise the unix socket is used.
 */
struct DockerEndpoint {
    std::string socketPath = "/var/run/docker.sock";
    std::string host;
    int port = 2375;
    std::string apiVersion = "v1.41";
    int readTimeoutSeconds = 3600;

    bool usesUnixSocket() const { return host.empty(); }
    std::string describe() const;
};

/**
 * @class DockerError
 * @brief A daemon call failed: transport error (status 0) or unexpected HTTP status.
 */
class DockerError : public std::runtime_error {
public:
    DockerError(const std::string& operation, int status, const std::string& detail);

    int status() const { return m_status; }

private:
    int m_status;
};

class DockerClient {
public:
    explicit DockerClient(DockerEndpoint endpoint);

    /** @brief GET /_ping; false on any failure. */
    bool ping();

    /** @brief True when the image is present locally. */
    bool imageExists(const std::string& imageReference);

    /** @brief Pulls an image and waits for the pull to finish. */
    void pullImage(const std::string& imageReference);

    /** @brief Creates a container from a Docker create-config and returns its id. */
    std::string createContainer(const nlohmann::json& config);

    void startContainer(const std::string& containerId);

    /** @brief Extracts a tar stream into the container at the given directory. */
    void putArchive(const std::string& containerId, const std::string& path, const std::string& tarBytes);

    /** @brief Registers an exec instance attached to stdout/stderr and returns its id. */
    std::string createExec(const std::string& containerId, const std::vector<std::string>& argv);

    /** @brief Starts an exec instance and returns the raw multiplexed output once it exits. */
    std::string startExec(const std::string& execId);

    /** @brief Exit code of a finished exec instance. */
    int inspectExecExitCode(const std::string& execId);

    /**
     * @brief Force-removes a container with its anonymous volumes.
     * @return True when the container is gone (including already gone).
     */
    bool removeContainer(const std::string& containerId);

    const DockerEndpoint& endpoint() const { return m_endpoint; }

    /** @brief Splits "name:tag" into its parts; "latest" when untagged, empty tag for digests. */
    static std::pair<std::string, std::string> SplitImageReference(const std::string& imageReference);

private:
    std::string apiPath(const std::string& path) const;

    DockerEndpoint m_endpoint;
};

} // namespace dockbuild::infrastructure
