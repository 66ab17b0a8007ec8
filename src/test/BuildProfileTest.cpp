#include <cassert>
#include <iostream>
#include <string>

#include "domain/BuildProfile.hpp"
#include "domain/ProjectType.hpp"
#include "infrastructure/HttpBuildServer.hpp"
#include <nlohmann/json.hpp>

using namespace dockbuild::domain;

namespace {

bool Contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

void testParsing() {
    assert(ParseProjectType("maven") == ProjectType::Maven);
    assert(ParseProjectType("MAVEN") == ProjectType::Maven);
    assert(ParseProjectType(" Npm ") == ProjectType::Npm);
    assert(ParseProjectType("pip") == ProjectType::Pip);
    assert(!ParseProjectType("bogus"));
    assert(!ParseProjectType(""));
    assert(!ParseProjectType("maven2"));
    assert(AllowedProjectTypesList() == "MAVEN, NPM, PIP");
}

void testTable() {
    BuildProfileCatalog catalog;

    auto maven = catalog.select(ProjectType::Maven);
    assert(maven.imageReference == "maven:3.8-openjdk-17");
    assert(maven.markerFile == "pom.xml");
    assert(maven.commandSequence.back() == "mvn -B clean install -DskipTests");
    // The maven image ships unzip, so no package manager step.
    assert(!Contains(maven.shellScript(), "apk add"));
    assert(!Contains(maven.shellScript(), "apt-get"));

    auto npm = catalog.select(ProjectType::Npm);
    assert(npm.imageReference == "node:20-alpine");
    assert(npm.markerFile == "package.json");
    assert(npm.commandSequence.front() == "apk add --no-cache unzip");
    assert(npm.commandSequence.back() == "npm install && npm run build");

    auto pip = catalog.select(ProjectType::Pip);
    assert(pip.imageReference == "python:3.11-slim");
    assert(pip.markerFile == "requirements.txt");
    assert(Contains(pip.commandSequence.front(), "apt-get install -y --no-install-recommends unzip"));
    assert(pip.commandSequence.back() == "pip install --no-cache-dir -r requirements.txt");
}

void testDeterminism() {
    BuildProfileCatalog catalog;
    for (ProjectType type : AllProjectTypes()) {
        auto first = catalog.select(type);
        auto second = catalog.select(type);
        assert(first.imageReference == second.imageReference);
        assert(first.commandSequence == second.commandSequence);
        assert(first.execArgv() == second.execArgv());
    }

    auto viaString = catalog.select(std::string("mAvEn"));
    assert(viaString);
    assert(viaString->commandSequence == catalog.select(ProjectType::Maven).commandSequence);
    assert(!catalog.select(std::string("gradle")));
}

void testScriptShape() {
    BuildProfileCatalog catalog;
    for (const auto& profile : catalog.all()) {
        auto argv = profile.execArgv();
        assert(argv.size() == 3);
        assert(argv[0] == "/bin/sh");
        assert(argv[1] == "-c");

        const std::string& script = argv[2];
        assert(script.rfind("set -e\n", 0) == 0);
        assert(Contains(script, "unzip -o code.zip -d src"));
        assert(Contains(script, "-maxdepth 2"));
        assert(Contains(script, "-name '" + profile.markerFile + "'"));
        assert(Contains(script, "No project root found: " + profile.markerFile));
        assert(Contains(script, "exit " + std::to_string(kNoProjectRootExitCode)));

        // Extraction precedes the root search, which precedes the build.
        auto unzipPos = script.find("unzip -o");
        auto findPos = script.find("find . -maxdepth 2");
        auto buildPos = script.find(profile.commandSequence.back());
        assert(unzipPos < findPos);
        assert(findPos < buildPos);
    }
}

void testImageOverride() {
    BuildProfileCatalog catalog({{ProjectType::Npm, "node:22-alpine"}});
    assert(catalog.select(ProjectType::Npm).imageReference == "node:22-alpine");
    assert(catalog.select(ProjectType::Maven).imageReference == "maven:3.8-openjdk-17");

    BuildProfileCatalog blank({{ProjectType::Pip, ""}});
    assert(blank.select(ProjectType::Pip).imageReference == "python:3.11-slim");
}

void testProjectTypesListing() {
    BuildProfileCatalog catalog({{ProjectType::Pip, "python:3.12-slim"}});
    auto listing = nlohmann::json::parse(dockbuild::infrastructure::HttpBuildServer::ProjectTypesJson(catalog));
    assert(listing.is_array());
    assert(listing.size() == 3);
    assert(listing[0]["projectType"] == "MAVEN");
    assert(listing[0]["markerFile"] == "pom.xml");
    assert(listing[2]["projectType"] == "PIP");
    assert(listing[2]["image"] == "python:3.12-slim");
}

} // namespace

int main() {
    std::cout << "[Test] Starting BuildProfile Test..." << std::endl;

    testParsing();
    testTable();
    testDeterminism();
    testScriptShape();
    testImageOverride();
    testProjectTypesListing();

    std::cout << "[PASS] BuildProfile Test." << std::endl;
    return 0;
}
