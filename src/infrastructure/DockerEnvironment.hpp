/**
 * @file DockerEnvironment.hpp
 * @brief Environment implementation backed by a Docker container.
 */

#pragma once

#include <memory>
#include <string>
#include "domain/Environment.hpp"
#include "infrastructure/DockerClient.hpp"

namespace dockbuild::infrastructure {

/**
 * @class DockerEnvironment
 * @brief One container created from an EnvironmentSpec's image and kept alive with its idle command.
 */
class DockerEnvironment : public domain::Environment {
public:
    DockerEnvironment(std::shared_ptr<DockerClient> client, domain::EnvironmentSpec spec);

    /** @brief Removes the container only if terminate() was never attempted. */
    ~DockerEnvironment() override;

    void start() override;
    void copyFileIn(const std::string& hostPath, const std::string& environmentPath) override;
    domain::ExecutionResult exec(const std::vector<std::string>& argv) override;
    bool terminate() override;
    std::string id() const override { return m_containerId; }

    /** @brief Builds the tar stream that places one file at an absolute path, parents included. */
    static std::string PackFileForPath(const std::string& environmentPath, const std::string& content);

private:
    void requireStarted(const char* operation) const;

    std::shared_ptr<DockerClient> m_client;
    domain::EnvironmentSpec m_spec;
    std::string m_containerId;
    bool m_terminateAttempted = false;
};

/**
 * @class DockerEnvironmentProvider
 * @brief Hands out DockerEnvironments sharing one daemon client.
 */
class DockerEnvironmentProvider : public domain::EnvironmentProvider {
public:
    explicit DockerEnvironmentProvider(std::shared_ptr<DockerClient> client);

    std::unique_ptr<domain::Environment> acquire(const domain::EnvironmentSpec& spec) override;

private:
    std::shared_ptr<DockerClient> m_client;
};

} // namespace dockbuild::infrastructure
