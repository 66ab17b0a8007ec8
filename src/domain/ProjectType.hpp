/**
 * @file ProjectType.hpp
 * @brief Project categories the build engine knows how to build.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace dockbuild::domain {

/**
 * @enum ProjectType
 * @brief Selects which build profile applies to an uploaded archive.
 */
enum class ProjectType {
    Maven,
    Npm,
    Pip
};

/** @brief Canonical upper-case tag ("MAVEN", "NPM", "PIP"). */
std::string ProjectTypeToString(ProjectType type);

/**
 * @brief Parses a raw tag case-insensitively, ignoring surrounding whitespace.
 * @return The matching type, or nullopt for anything unrecognized.
 */
std::optional<ProjectType> ParseProjectType(const std::string& raw);

/** @brief All supported types in table order. */
const std::vector<ProjectType>& AllProjectTypes();

/** @brief "MAVEN, NPM, PIP" */
std::string AllowedProjectTypesList();

} // namespace dockbuild::domain
