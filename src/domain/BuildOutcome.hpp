/**
 * @file BuildOutcome.hpp
 * @brief Final textual result of a build attempt.
 */

#pragma once

#include <optional>
#include <string>
#include "domain/BuildProfile.hpp"
#include "domain/ExecutionResult.hpp"

namespace dockbuild::domain {

/**
 * @class BuildOutcome
 * @brief What the engine hands back to its caller, rendered by toString().
 *
 * Every build attempt produces exactly one outcome, whichever stage it
 * stopped at.
 */
class BuildOutcome {
public:
    enum class Kind {
        ConfigurationError, ///< Unsupported project type; nothing was provisioned.
        ExecutionError,     ///< Provisioning, transfer or exec raised.
        Completed           ///< The command sequence ran; see exit code.
    };

    static BuildOutcome UnsupportedProjectType(const std::string& rawType);
    static BuildOutcome Failed(const BuildProfile& profile, const std::string& message);
    static BuildOutcome Finished(const BuildProfile& profile, ExecutionResult result);

    Kind kind() const { return m_kind; }
    bool succeeded() const { return m_kind == Kind::Completed && m_result && m_result->succeeded(); }
    const std::optional<ExecutionResult>& result() const { return m_result; }

    /** @brief "SUCCESS" or "FAILED"; empty when the build never executed. */
    std::string status() const;

    std::string toString() const;

private:
    BuildOutcome() = default;

    Kind m_kind = Kind::ConfigurationError;
    std::string m_imageReference;
    std::string m_commandLine;
    std::string m_message;
    std::optional<ExecutionResult> m_result;
};

} // namespace dockbuild::domain
