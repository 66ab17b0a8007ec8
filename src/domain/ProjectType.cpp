#include "domain/ProjectType.hpp"

#include <algorithm>
#include <cctype>

namespace dockbuild::domain {

namespace {

std::string Trim(const std::string& value) {
    auto begin = std::find_if_not(value.begin(), value.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(value.rbegin(), value.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    if (begin >= end) return {};
    return std::string(begin, end);
}

} // namespace

std::string ProjectTypeToString(ProjectType type) {
    switch (type) {
        case ProjectType::Maven: return "MAVEN";
        case ProjectType::Npm: return "NPM";
        case ProjectType::Pip: return "PIP";
    }
    return "UNKNOWN";
}

std::optional<ProjectType> ParseProjectType(const std::string& raw) {
    std::string token = Trim(raw);
    std::transform(token.begin(), token.end(), token.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    for (ProjectType type : AllProjectTypes()) {
        if (token == ProjectTypeToString(type)) {
            return type;
        }
    }
    return std::nullopt;
}

const std::vector<ProjectType>& AllProjectTypes() {
    static const std::vector<ProjectType> types = {
        ProjectType::Maven,
        ProjectType::Npm,
        ProjectType::Pip
    };
    return types;
}

std::string AllowedProjectTypesList() {
    std::string out;
    for (ProjectType type : AllProjectTypes()) {
        if (!out.empty()) out += ", ";
        out += ProjectTypeToString(type);
    }
    return out;
}

} // namespace dockbuild::domain
