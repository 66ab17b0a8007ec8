// Runs the project-root part of the generated build script against real
// directory trees with /bin/sh and checks where the build would run.
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <sys/wait.h>

#include "domain/BuildProfile.hpp"
#include "infrastructure/PathUtils.hpp"

using namespace dockbuild::domain;
namespace fs = std::filesystem;

namespace {

struct SearchRun {
    int exitCode = -1;
    std::string buildDir;
    std::string stderrText;
};

bool Contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

std::string ReadAll(const fs::path& path) {
    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

void Touch(const fs::path& path) {
    fs::create_directories(path.parent_path());
    std::ofstream(path) << "x\n";
}

// Steps from the marker search up to, not including, the build tool step.
std::string RootSearchScript(const BuildProfile& profile) {
    std::string script;
    bool inSearch = false;
    for (std::size_t i = 0; i + 1 < profile.commandSequence.size(); ++i) {
        const std::string& step = profile.commandSequence[i];
        if (step.rfind("MARKER_PATH=", 0) == 0) inSearch = true;
        if (inSearch) script += step + "\n";
    }
    assert(inSearch);
    return script;
}

SearchRun RunSearch(const fs::path& sourceRoot, ProjectType type) {
    BuildProfile profile = BuildProfileCatalog().select(type);
    fs::path scratch = sourceRoot.parent_path();
    fs::path scriptFile = scratch / "search.sh";
    fs::path outFile = scratch / "build-dir.txt";
    fs::path errFile = scratch / "stderr.txt";
    fs::remove(outFile);

    {
        std::ofstream script(scriptFile);
        script << "set -e\n"
               << "cd '" << sourceRoot.string() << "'\n"
               << RootSearchScript(profile)
               << "pwd -P > '" << outFile.string() << "'\n";
    }

    std::string command = "/bin/sh '" + scriptFile.string() + "' > /dev/null 2> '" + errFile.string() + "'";
    int status = std::system(command.c_str());
    assert(status != -1 && WIFEXITED(status));

    SearchRun run;
    run.exitCode = WEXITSTATUS(status);
    run.stderrText = ReadAll(errFile);
    if (fs::exists(outFile)) {
        run.buildDir = ReadAll(outFile);
        while (!run.buildDir.empty() && run.buildDir.back() == '\n') run.buildDir.pop_back();
    }
    return run;
}

class Fixture {
public:
    Fixture() : m_base(fs::temp_directory_path() / ("dockbuild-root-search-" + dockbuild::infrastructure::PathUtils::RandomUuid())) {
        fs::create_directories(m_base / "src");
    }
    ~Fixture() {
        std::error_code ec;
        fs::remove_all(m_base, ec);
    }
    fs::path src() const { return m_base / "src"; }
    std::string resolved(const fs::path& relative) const {
        return fs::canonical(src() / relative).string();
    }

private:
    fs::path m_base;
};

void testFlatArchiveWithNestedModule() {
    Fixture f;
    Touch(f.src() / "pom.xml");
    Touch(f.src() / "module" / "pom.xml");

    SearchRun run = RunSearch(f.src(), ProjectType::Maven);
    assert(run.exitCode == 0);
    assert(run.buildDir == f.resolved("."));
}

void testSingleTopLevelFolder() {
    Fixture f;
    Touch(f.src() / "demo-service" / "pom.xml");
    Touch(f.src() / "demo-service" / "src" / "Main.java");

    SearchRun run = RunSearch(f.src(), ProjectType::Maven);
    assert(run.exitCode == 0);
    assert(run.buildDir == f.resolved("demo-service"));
}

void testSiblingFoldersResolveLexically() {
    Fixture f;
    // Created out of order so directory order cannot decide.
    Touch(f.src() / "b" / "requirements.txt");
    Touch(f.src() / "a" / "requirements.txt");

    SearchRun run = RunSearch(f.src(), ProjectType::Pip);
    assert(run.exitCode == 0);
    assert(run.buildDir == f.resolved("a"));
}

void testMarkerTooDeep() {
    Fixture f;
    Touch(f.src() / "outer" / "inner" / "pom.xml");

    SearchRun run = RunSearch(f.src(), ProjectType::Maven);
    assert(run.exitCode == kNoProjectRootExitCode);
    assert(run.buildDir.empty());
    assert(Contains(run.stderrText, "No project root found: pom.xml not present within two directory levels"));
}

void testDirectoryNamedLikeMarkerIsIgnored() {
    Fixture f;
    fs::create_directories(f.src() / "package.json");
    Touch(f.src() / "web" / "package.json");

    SearchRun run = RunSearch(f.src(), ProjectType::Npm);
    assert(run.exitCode == 0);
    assert(run.buildDir == f.resolved("web"));
}

void testFolderNameWithSpace() {
    Fixture f;
    Touch(f.src() / "my project" / "package.json");

    SearchRun run = RunSearch(f.src(), ProjectType::Npm);
    assert(run.exitCode == 0);
    assert(run.buildDir == f.resolved("my project"));
}

} // namespace

int main() {
    std::cout << "[Test] Starting ProjectRootSearch Test..." << std::endl;

    testFlatArchiveWithNestedModule();
    testSingleTopLevelFolder();
    testSiblingFoldersResolveLexically();
    testMarkerTooDeep();
    testDirectoryNamedLikeMarkerIsIgnored();
    testFolderNameWithSpace();

    std::cout << "[PASS] ProjectRootSearch Test." << std::endl;
    return 0;
}
