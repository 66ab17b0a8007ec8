// Test double for the environment capability: records every lifecycle call
// and can be told to throw at a chosen step.
#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "domain/Environment.hpp"

namespace dockbuild::test {

enum class FailAt { Nothing, Start, Copy, Exec, Teardown };

// Thrown by terminate() for FailAt::Teardown; deliberately not a std::exception.
struct TeardownFault {
    int code;
};

struct EnvironmentLog {
    std::atomic<int> acquired{0};
    std::atomic<int> started{0};
    std::atomic<int> copied{0};
    std::atomic<int> executed{0};
    std::atomic<int> terminated{0};
    std::vector<std::string> images;
    std::vector<std::string> copyTargets;
    std::vector<std::vector<std::string>> argvs;
    bool archiveExistedDuringCopy = false;
};

class RecordingEnvironment : public domain::Environment {
public:
    RecordingEnvironment(std::shared_ptr<EnvironmentLog> log, FailAt failAt,
                         domain::ExecutionResult scripted, int serial)
        : m_log(std::move(log)), m_failAt(failAt), m_scripted(std::move(scripted)),
          m_id("env-" + std::to_string(serial)) {}

    void start() override {
        m_log->started++;
        if (m_failAt == FailAt::Start) throw std::runtime_error("image pull failed");
    }

    void copyFileIn(const std::string& hostPath, const std::string& environmentPath) override {
        m_log->copied++;
        m_log->copyTargets.push_back(environmentPath);
        m_log->archiveExistedDuringCopy = std::filesystem::exists(hostPath);
        if (m_failAt == FailAt::Copy) throw std::runtime_error("copy refused");
    }

    domain::ExecutionResult exec(const std::vector<std::string>& argv) override {
        m_log->executed++;
        m_log->argvs.push_back(argv);
        if (m_failAt == FailAt::Exec) throw std::runtime_error("exec connection reset");
        return m_scripted;
    }

    bool terminate() override {
        m_log->terminated++;
        if (m_failAt == FailAt::Teardown) throw TeardownFault{42};
        return true;
    }

    std::string id() const override { return m_id; }

private:
    std::shared_ptr<EnvironmentLog> m_log;
    FailAt m_failAt;
    domain::ExecutionResult m_scripted;
    std::string m_id;
};

class RecordingProvider : public domain::EnvironmentProvider {
public:
    explicit RecordingProvider(FailAt failAt = FailAt::Nothing, domain::ExecutionResult scripted = {0, "", ""})
        : log(std::make_shared<EnvironmentLog>()), m_failAt(failAt), m_scripted(std::move(scripted)) {}

    std::unique_ptr<domain::Environment> acquire(const domain::EnvironmentSpec& spec) override {
        int serial = ++log->acquired;
        log->images.push_back(spec.imageReference);
        return std::make_unique<RecordingEnvironment>(log, m_failAt, m_scripted, serial);
    }

    std::shared_ptr<EnvironmentLog> log;

private:
    FailAt m_failAt;
    domain::ExecutionResult m_scripted;
};

} // namespace dockbuild::test
