/**
 * @file ScopedEnvironment.hpp
 * @brief RAII owner that tears an environment down exactly once.
 */

#pragma once

#include <iostream>
#include <memory>
#include "domain/Environment.hpp"

namespace dockbuild::application {

/**
 * @class ScopedEnvironment
 * @brief Owns an acquired environment and terminates it when the scope ends.
 *
 * Teardown happens on every exit path, including exceptions thrown while
 * starting, copying into or executing in the environment.
 */
class ScopedEnvironment {
public:
    explicit ScopedEnvironment(std::unique_ptr<domain::Environment> environment)
        : m_environment(std::move(environment)) {}

    ~ScopedEnvironment() {
        release();
    }

    ScopedEnvironment(const ScopedEnvironment&) = delete;
    ScopedEnvironment& operator=(const ScopedEnvironment&) = delete;

    domain::Environment* operator->() const { return m_environment.get(); }
    domain::Environment& operator*() const { return *m_environment; }

    /** @brief Terminates now instead of at scope exit. Later calls are no-ops. */
    void release() {
        if (!m_environment || m_released) return;
        m_released = true;

        const std::string id = m_environment->id();
        try {
            if (!m_environment->terminate()) {
                std::cerr << "[BuildService] Teardown reported failure for environment '" << id << "'" << std::endl;
            }
        } catch (const std::exception& e) {
            std::cerr << "[BuildService] Teardown of environment '" << id << "' threw: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "[BuildService] Teardown of environment '" << id << "' threw an unknown error" << std::endl;
        }
    }

private:
    std::unique_ptr<domain::Environment> m_environment;
    bool m_released = false;
};

} // namespace dockbuild::application
