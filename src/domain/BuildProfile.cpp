/**
 * @file BuildProfile.cpp
 * @brief Profile table and build script assembly.
 */

#include "domain/BuildProfile.hpp"

#include <sstream>

namespace dockbuild::domain {

namespace {

// Extraction steps shared by every profile. The archive lands in /app/src.
std::vector<std::string> ExtractionSteps() {
    return {
        "mkdir -p /app/src",
        "cd /app",
        "unzip -o code.zip -d src",
        "echo 'Unzipped code.'",
        "rm code.zip",
        "cd src"
    };
}

// Locates the marker within two levels, shallowest match first and then
// lexical order, so both flat archives and archives with a single top-level
// folder resolve the same way. Uses only busybox-compatible tools.
std::vector<std::string> ProjectRootSteps(const std::string& marker) {
    std::ostringstream search;
    search << "MARKER_PATH=$(find . -maxdepth 2 -type f -name '" << marker << "'"
           << " | awk -F/ '{ print NF \" \" $0 }'"
           << " | LC_ALL=C sort -k1,1n -k2"
           << " | head -n 1 | cut -d' ' -f2-)";

    std::ostringstream guard;
    guard << "if [ -z \"$MARKER_PATH\" ]; then "
          << "echo 'No project root found: " << marker
          << " not present within two directory levels' >&2; "
          << "exit " << kNoProjectRootExitCode << "; fi";

    return {
        search.str(),
        guard.str(),
        "BUILD_DIR=$(dirname \"$MARKER_PATH\")",
        "cd \"$BUILD_DIR\"",
        "echo \"Building in directory: $(pwd)\"",
        "ls -la"
    };
}

std::string SetupStep(ProjectType type) {
    switch (type) {
        case ProjectType::Maven:
            return {}; // image already ships unzip
        case ProjectType::Npm:
            return "apk add --no-cache unzip";
        case ProjectType::Pip:
            return "apt-get update && apt-get install -y --no-install-recommends unzip && rm -rf /var/lib/apt/lists/*";
    }
    return {};
}

std::string BuildStep(ProjectType type) {
    switch (type) {
        case ProjectType::Maven:
            return "mvn -B clean install -DskipTests";
        case ProjectType::Npm:
            return "npm install && npm run build";
        case ProjectType::Pip:
            return "pip install --no-cache-dir -r requirements.txt";
    }
    return {};
}

} // namespace

std::string BuildProfile::shellScript() const {
    std::string script = "set -e";
    for (const auto& step : commandSequence) {
        script += "\n";
        script += step;
    }
    return script;
}

std::vector<std::string> BuildProfile::execArgv() const {
    return {"/bin/sh", "-c", shellScript()};
}

BuildProfileCatalog::BuildProfileCatalog(std::map<ProjectType, std::string> imageOverrides)
    : m_imageOverrides(std::move(imageOverrides)) {}

BuildProfile BuildProfileCatalog::select(ProjectType type) const {
    BuildProfile profile;
    profile.projectType = type;
    profile.markerFile = MarkerFile(type);

    auto it = m_imageOverrides.find(type);
    profile.imageReference = (it != m_imageOverrides.end() && !it->second.empty())
        ? it->second
        : DefaultImage(type);

    std::string setup = SetupStep(type);
    if (!setup.empty()) {
        profile.commandSequence.push_back(setup);
    }
    for (auto& step : ExtractionSteps()) {
        profile.commandSequence.push_back(std::move(step));
    }
    for (auto& step : ProjectRootSteps(profile.markerFile)) {
        profile.commandSequence.push_back(std::move(step));
    }
    profile.commandSequence.push_back(BuildStep(type));
    return profile;
}

std::optional<BuildProfile> BuildProfileCatalog::select(const std::string& rawType) const {
    auto type = ParseProjectType(rawType);
    if (!type) {
        return std::nullopt;
    }
    return select(*type);
}

std::vector<BuildProfile> BuildProfileCatalog::all() const {
    std::vector<BuildProfile> profiles;
    for (ProjectType type : AllProjectTypes()) {
        profiles.push_back(select(type));
    }
    return profiles;
}

std::string BuildProfileCatalog::DefaultImage(ProjectType type) {
    switch (type) {
        case ProjectType::Maven: return "maven:3.8-openjdk-17";
        case ProjectType::Npm: return "node:20-alpine";
        case ProjectType::Pip: return "python:3.11-slim";
    }
    return {};
}

std::string BuildProfileCatalog::MarkerFile(ProjectType type) {
    switch (type) {
        case ProjectType::Maven: return "pom.xml";
        case ProjectType::Npm: return "package.json";
        case ProjectType::Pip: return "requirements.txt";
    }
    return {};
}

} // namespace dockbuild::domain
