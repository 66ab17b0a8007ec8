#include "domain/BuildOutcome.hpp"

#include <sstream>

namespace dockbuild::domain {

namespace {

std::string JoinArgs(const std::vector<std::string>& args) {
    std::string out;
    for (const auto& arg : args) {
        if (!out.empty()) out += " ";
        out += arg;
    }
    return out;
}

} // namespace

BuildOutcome BuildOutcome::UnsupportedProjectType(const std::string& rawType) {
    BuildOutcome outcome;
    outcome.m_kind = Kind::ConfigurationError;
    outcome.m_message = "Error: Unsupported project type: " + rawType +
                        ". Allowed types: " + AllowedProjectTypesList();
    return outcome;
}

BuildOutcome BuildOutcome::Failed(const BuildProfile& profile, const std::string& message) {
    BuildOutcome outcome;
    outcome.m_kind = Kind::ExecutionError;
    outcome.m_imageReference = profile.imageReference;
    outcome.m_commandLine = JoinArgs(profile.execArgv());
    outcome.m_message = message;
    return outcome;
}

BuildOutcome BuildOutcome::Finished(const BuildProfile& profile, ExecutionResult result) {
    BuildOutcome outcome;
    outcome.m_kind = Kind::Completed;
    outcome.m_imageReference = profile.imageReference;
    outcome.m_commandLine = JoinArgs(profile.execArgv());
    outcome.m_result = std::move(result);
    return outcome;
}

std::string BuildOutcome::status() const {
    if (m_kind != Kind::Completed) return {};
    return succeeded() ? "SUCCESS" : "FAILED";
}

std::string BuildOutcome::toString() const {
    if (m_kind == Kind::ConfigurationError) {
        return m_message;
    }

    std::ostringstream out;
    out << "Using build image: " << m_imageReference << "\n";
    out << "Attempting to run commands:\n" << m_commandLine << "\n\n";

    if (m_kind == Kind::ExecutionError) {
        out << "\nExecution Error: " << m_message;
        return out.str();
    }

    out << "--- BUILD LOGS ---\n";
    out << "Exit Code: " << m_result->exitCode << "\n\n";
    out << "--- STDOUT ---\n" << m_result->stdoutText << "\n\n";
    out << "--- STDERR ---\n" << m_result->stderrText << "\n";
    out << "\n--- BUILD STATUS: " << status() << " ---";
    return out.str();
}

} // namespace dockbuild::domain
