/*
 * multibench - Contention-aware benchmark orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <sys/types.h>

#include "multibench/job.hpp"

namespace multibench {

// A running dummy process.
class ProcessHandle {
public:
    virtual ~ProcessHandle() = default;

    [[nodiscard]] virtual pid_t pid() const noexcept = 0;

    // Sends SIGTERM once. False if the signal could not be delivered,
    // e.g. because the process already exited.
    virtual bool terminate() noexcept = 0;
};

struct TimingResult {
    bool ok = false;
    int exitCode = -1;
    int signal = 0;       // terminating signal, 0 if the process exited
    std::string output;   // captured stdout, empty when inherited
    std::string error;
    explicit operator bool() const noexcept { return ok; }
};

enum class OutputMode : uint8_t {
    Capture,
    Inherit
};

// Starts jobs. The orchestrator only talks to processes through this.
class Launcher {
public:
    virtual ~Launcher() = default;

    // Starts a dummy without waiting for it. Throws LaunchError.
    [[nodiscard]] virtual std::unique_ptr<ProcessHandle> launch(const JobSpec& job) = 0;

    // Runs the timing job to completion. Throws LaunchError if it cannot start.
    [[nodiscard]] virtual TimingResult run(const JobSpec& job, OutputMode mode) = 0;

    // Collects exit statuses of terminated dummies without blocking.
    virtual void reap() noexcept {}
};

// Dummies launched for one problem. Every handle still held is signaled
// when the group goes out of scope, including during stack unwinding.
class DummyGroup final {
public:
    DummyGroup() = default;
    ~DummyGroup();

    DummyGroup(const DummyGroup&) = delete;
    DummyGroup& operator=(const DummyGroup&) = delete;
    DummyGroup(DummyGroup&&) = delete;
    DummyGroup& operator=(DummyGroup&&) = delete;

    void add(std::unique_ptr<ProcessHandle> handle);
    [[nodiscard]] std::size_t size() const noexcept { return handles_.size(); }
    [[nodiscard]] bool empty() const noexcept { return handles_.empty(); }

    // Signals and drops every handle, in launch order. Returns how many
    // signals were delivered.
    std::size_t terminateAll() noexcept;

private:
    std::vector<std::unique_ptr<ProcessHandle>> handles_;
};

// Launcher backed by fork/exec. Children inherit the parent environment
// plus the job's overlay; dummy stdout goes to /dev/null.
class ProcessSupervisor final : public Launcher {
public:
    ProcessSupervisor();
    ~ProcessSupervisor() override;

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;
    ProcessSupervisor(ProcessSupervisor&&) = delete;
    ProcessSupervisor& operator=(ProcessSupervisor&&) = delete;

    [[nodiscard]] std::unique_ptr<ProcessHandle> launch(const JobSpec& job) override;
    [[nodiscard]] TimingResult run(const JobSpec& job, OutputMode mode) override;
    void reap() noexcept override;

    // Signaled dummies not yet reaped.
    [[nodiscard]] std::size_t pendingCount() const noexcept { return pending_->size(); }

private:
    // pids of signaled dummies, shared with the handles that add to it
    std::shared_ptr<std::vector<pid_t>> pending_;
};

}
