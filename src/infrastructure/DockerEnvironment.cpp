/**
 * @file DockerEnvironment.cpp
 * @brief Implementation of DockerEnvironment and DockerEnvironmentProvider.
 */

#include "infrastructure/DockerEnvironment.hpp"
#include "infrastructure/DockerStream.hpp"
#include "infrastructure/TarArchive.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace dockbuild::infrastructure {

using json = nlohmann::json;

DockerEnvironment::DockerEnvironment(std::shared_ptr<DockerClient> client, domain::EnvironmentSpec spec)
    : m_client(std::move(client)), m_spec(std::move(spec)) {}

DockerEnvironment::~DockerEnvironment() {
    // An attempted terminate() is final, even a failed one; no retry here.
    if (m_containerId.empty() || m_terminateAttempted) {
        return;
    }
    try {
        terminate();
    } catch (const std::exception& e) {
        std::cerr << "[DockerEnvironment] Removing container " << m_containerId << " threw: " << e.what() << std::endl;
    }
}

void DockerEnvironment::start() {
    if (!m_containerId.empty()) {
        throw std::logic_error("Environment already started: " + m_containerId);
    }

    if (!m_client->imageExists(m_spec.imageReference)) {
        m_client->pullImage(m_spec.imageReference);
    }

    json config = {
        {"Image", m_spec.imageReference},
        {"Cmd", m_spec.idleCommand},
        {"Labels", m_spec.labels},
        {"Tty", false},
        {"AttachStdout", false},
        {"AttachStderr", false}
    };

    // Recorded before starting so a failed start still gets cleaned up.
    m_containerId = m_client->createContainer(config);
    std::cout << "[DockerEnvironment] Created container " << m_containerId
              << " from " << m_spec.imageReference << std::endl;

    m_client->startContainer(m_containerId);
}

void DockerEnvironment::copyFileIn(const std::string& hostPath, const std::string& environmentPath) {
    requireStarted("copy into");

    std::ifstream in(hostPath, std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot read file to copy: " + hostPath);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    m_client->putArchive(m_containerId, "/", PackFileForPath(environmentPath, buffer.str()));
}

domain::ExecutionResult DockerEnvironment::exec(const std::vector<std::string>& argv) {
    requireStarted("exec in");

    std::string execId = m_client->createExec(m_containerId, argv);
    std::string raw = m_client->startExec(execId);
    auto output = DockerStream::Demultiplex(raw);

    domain::ExecutionResult result;
    result.exitCode = m_client->inspectExecExitCode(execId);
    result.stdoutText = std::move(output.stdoutText);
    result.stderrText = std::move(output.stderrText);
    return result;
}

bool DockerEnvironment::terminate() {
    if (m_containerId.empty()) {
        return true; // nothing was created
    }
    m_terminateAttempted = true;
    bool removed = m_client->removeContainer(m_containerId);
    if (removed) {
        std::cout << "[DockerEnvironment] Removed container " << m_containerId << std::endl;
        m_containerId.clear();
    } else {
        std::cerr << "[DockerEnvironment] Failed to remove container " << m_containerId << std::endl;
    }
    return removed;
}

std::string DockerEnvironment::PackFileForPath(const std::string& environmentPath, const std::string& content) {
    fs::path target(environmentPath);
    if (!target.is_absolute() || !target.has_filename()) {
        throw std::invalid_argument("Environment path must be an absolute file path: " + environmentPath);
    }

    TarArchive archive;
    fs::path relative = target.relative_path().lexically_normal();
    fs::path parents;
    for (const auto& part : relative.parent_path()) {
        parents /= part;
        archive.addDirectory(parents.generic_string());
    }
    archive.addFile(relative.generic_string(), content);
    return archive.finish();
}

void DockerEnvironment::requireStarted(const char* operation) const {
    if (m_containerId.empty()) {
        throw std::logic_error(std::string("Cannot ") + operation + " an environment that was not started");
    }
}

DockerEnvironmentProvider::DockerEnvironmentProvider(std::shared_ptr<DockerClient> client)
    : m_client(std::move(client)) {}

std::unique_ptr<domain::Environment> DockerEnvironmentProvider::acquire(const domain::EnvironmentSpec& spec) {
    return std::make_unique<DockerEnvironment>(m_client, spec);
}

} // namespace dockbuild::infrastructure
