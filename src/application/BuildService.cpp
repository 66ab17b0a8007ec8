/**
 * @file BuildService.cpp
 * @brief Implementation of BuildService.
 */

#include "application/BuildService.hpp"
#include "application/ScopedEnvironment.hpp"

#include <iostream>
#include <stdexcept>

namespace dockbuild::application {

BuildService::BuildService(std::shared_ptr<domain::EnvironmentProvider> provider,
                           domain::BuildProfileCatalog catalog)
    : m_provider(std::move(provider)), m_catalog(std::move(catalog)) {
    if (!m_provider) {
        throw std::invalid_argument("BuildService requires an environment provider");
    }
    std::cout << "[BuildService] Initialized." << std::endl;
}

std::string BuildService::executeBuild(const std::string& archivePath, const std::string& projectType) {
    std::cout << "[BuildService] Starting synchronous build for type: " << projectType
              << ", file: " << archivePath << std::endl;

    auto profile = m_catalog.select(projectType);
    if (!profile) {
        std::cerr << "[BuildService] Unsupported project type received: " << projectType << std::endl;
        return domain::BuildOutcome::UnsupportedProjectType(projectType).toString();
    }

    try {
        std::string text = runBuild(*profile, archivePath).toString();
        std::cout << "[BuildService] Synchronous build finished for file " << archivePath << "." << std::endl;
        return text;
    } catch (const std::exception& e) {
        // Only formatting can get here; runBuild converts lifecycle errors itself.
        std::cerr << "[BuildService] Unexpected error for file " << archivePath << ": " << e.what() << std::endl;
        return domain::BuildOutcome::Failed(*profile, e.what()).toString();
    }
}

domain::BuildOutcome BuildService::runBuild(const domain::BuildProfile& profile, const std::string& archivePath) {
    domain::EnvironmentSpec spec;
    spec.imageReference = profile.imageReference;
    spec.labels["dockbuild.managed"] = "true";
    spec.labels["dockbuild.project-type"] = domain::ProjectTypeToString(profile.projectType);

    try {
        std::cout << "[BuildService] Creating environment with image: " << profile.imageReference << std::endl;
        auto acquired = m_provider->acquire(spec);
        if (!acquired) {
            throw std::runtime_error("Environment provider returned no environment");
        }
        ScopedEnvironment environment(std::move(acquired));

        environment->start();
        std::cout << "[BuildService] Environment started: " << environment->id() << std::endl;

        environment->copyFileIn(archivePath, domain::kEnvironmentArchivePath);
        std::cout << "[BuildService] Copied archive " << archivePath << " to "
                  << domain::kEnvironmentArchivePath << std::endl;

        std::cout << "[BuildService] Executing build commands in environment..." << std::endl;
        domain::ExecutionResult result = environment->exec(profile.execArgv());
        std::cout << "[BuildService] Build commands finished with exit code: " << result.exitCode << std::endl;

        environment.release();

        if (result.succeeded()) {
            std::cout << "[BuildService] Build SUCCESSFUL for file " << archivePath << std::endl;
        } else {
            std::cerr << "[BuildService] Build FAILED for file " << archivePath << std::endl;
        }
        return domain::BuildOutcome::Finished(profile, std::move(result));
    } catch (const std::exception& e) {
        std::cerr << "[BuildService] Error during build execution for file " << archivePath
                  << ": " << e.what() << std::endl;
        return domain::BuildOutcome::Failed(profile, e.what());
    } catch (...) {
        std::cerr << "[BuildService] Unknown error during build execution for file " << archivePath << std::endl;
        return domain::BuildOutcome::Failed(profile, "Unknown error during build execution.");
    }
}

} // namespace dockbuild::application
