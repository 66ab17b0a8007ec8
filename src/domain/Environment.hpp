/**
 * @file Environment.hpp
 * @brief Interface for ephemeral, isolated build environments.
 */

#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>
#include "domain/ExecutionResult.hpp"

namespace dockbuild::domain {

/**
 * @struct EnvironmentSpec
 * @brief What an environment is created from.
 */
struct EnvironmentSpec {
    std::string imageReference;
    std::vector<std::string> idleCommand = {"sleep", "infinity"}; ///< Keeps the environment alive between steps.
    std::map<std::string, std::string> labels;
};

/**
 * @class Environment
 * @brief One isolated execution context, owned by a single build.
 *
 * Acquiring an Environment does no I/O; start() provisions it. terminate()
 * releases whatever start() managed to create and must be safe to call at
 * any point of the lifecycle, including before start().
 */
class Environment {
public:
    virtual ~Environment() = default;

    /** @brief Provisions the environment and leaves it running idle. */
    virtual void start() = 0;

    /**
     * @brief Copies a local file into the environment.
     * @param hostPath File on the local filesystem.
     * @param environmentPath Absolute destination path inside the environment.
     */
    virtual void copyFileIn(const std::string& hostPath, const std::string& environmentPath) = 0;

    /** @brief Runs argv to completion and captures its streams and exit code. */
    virtual ExecutionResult exec(const std::vector<std::string>& argv) = 0;

    /** @brief Destroys the environment. Reports failures through its return value only. */
    virtual bool terminate() = 0;

    /** @brief Runtime identifier, empty until started. */
    virtual std::string id() const = 0;
};

/**
 * @class EnvironmentProvider
 * @brief Factory for environments; the injected container runtime capability.
 */
class EnvironmentProvider {
public:
    virtual ~EnvironmentProvider() = default;

    virtual std::unique_ptr<Environment> acquire(const EnvironmentSpec& spec) = 0;
};

} // namespace dockbuild::domain
