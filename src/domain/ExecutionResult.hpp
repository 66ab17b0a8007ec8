/**
 * @file ExecutionResult.hpp
 * @brief Captured result of running a command inside an environment.
 */

#pragma once

#include <string>

namespace dockbuild::domain {

struct ExecutionResult {
    int exitCode = -1;
    std::string stdoutText;
    std::string stderrText;

    bool succeeded() const { return exitCode == 0; }
};

} // namespace dockbuild::domain
