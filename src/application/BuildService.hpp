/**
 * @file BuildService.hpp
 * @brief Synchronous build engine: profile selection and environment lifecycle.
 */

#pragma once

#include <memory>
#include <string>
#include "domain/BuildOutcome.hpp"
#include "domain/BuildProfile.hpp"
#include "domain/Environment.hpp"

namespace dockbuild::application {

/**
 * @class BuildService
 * @brief Builds an uploaded archive inside a fresh environment per call.
 *
 * Each call runs end-to-end on the calling thread. Concurrent calls share
 * nothing but the provider, and each gets its own environment.
 */
class BuildService {
public:
    BuildService(std::shared_ptr<domain::EnvironmentProvider> provider,
                 domain::BuildProfileCatalog catalog = domain::BuildProfileCatalog());

    /**
     * @brief Builds the archive and returns the complete textual outcome.
     * @param archivePath Local archive owned by the caller; only read.
     * @param projectType Raw, case-insensitive project type tag.
     * @return The rendered BuildOutcome. Never throws.
     */
    std::string executeBuild(const std::string& archivePath, const std::string& projectType);

    /**
     * @brief Runs one build attempt for an already selected profile.
     * @return Completed or ExecutionError outcome; the environment is gone on return.
     */
    domain::BuildOutcome runBuild(const domain::BuildProfile& profile, const std::string& archivePath);

    const domain::BuildProfileCatalog& catalog() const { return m_catalog; }

private:
    std::shared_ptr<domain::EnvironmentProvider> m_provider;
    domain::BuildProfileCatalog m_catalog;
};

} // namespace dockbuild::application
