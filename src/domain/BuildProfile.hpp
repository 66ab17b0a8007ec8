/**
 * @file BuildProfile.hpp
 * @brief Image and command sequence used to build one project type.
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "domain/ProjectType.hpp"

namespace dockbuild::domain {

/** @brief Fixed location of the uploaded archive inside every environment. */
inline constexpr const char* kEnvironmentArchivePath = "/app/code.zip";

/** @brief Exit status of the build script when no marker file was found. */
inline constexpr int kNoProjectRootExitCode = 3;

/**
 * @struct BuildProfile
 * @brief Immutable description of how a project type is built.
 */
struct BuildProfile {
    ProjectType projectType;
    std::string imageReference;  ///< e.g. "maven:3.8-openjdk-17"
    std::string markerFile;      ///< File identifying the project root.
    std::vector<std::string> commandSequence; ///< Shell steps, executed in order.

    /** @brief The steps as a single `set -e` shell script. */
    std::string shellScript() const;

    /** @brief The argv executed inside the environment: /bin/sh -c <script>. */
    std::vector<std::string> execArgv() const;
};

/**
 * @class BuildProfileCatalog
 * @brief Static profile table keyed by ProjectType.
 *
 * Only the image reference can be overridden (from configuration); marker
 * files and command sequences are fixed per type.
 */
class BuildProfileCatalog {
public:
    explicit BuildProfileCatalog(std::map<ProjectType, std::string> imageOverrides = {});

    /** @brief Profile for a known type. Pure function of type and overrides. */
    BuildProfile select(ProjectType type) const;

    /** @brief Profile for a raw, case-insensitive tag; nullopt when unsupported. */
    std::optional<BuildProfile> select(const std::string& rawType) const;

    /** @brief Profiles for every supported type, in table order. */
    std::vector<BuildProfile> all() const;

    static std::string DefaultImage(ProjectType type);
    static std::string MarkerFile(ProjectType type);

private:
    std::map<ProjectType, std::string> m_imageOverrides;
};

} // namespace dockbuild::domain
