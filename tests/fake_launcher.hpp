/*
 * multibench - Contention-aware benchmark orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "multibench/errors.hpp"
#include "multibench/supervisor.hpp"

namespace multibench::testing {

// Records every job instead of starting processes.
class FakeLauncher final : public Launcher {
public:
    struct Handle final : ProcessHandle {
        Handle(FakeLauncher& owner, pid_t pid) : owner_(owner), pid_(pid) {}
        pid_t pid() const noexcept override { return pid_; }
        bool terminate() noexcept override {
            if (owner_.live.erase(pid_) == 0) return false;
            owner_.terminated.push_back(pid_);
            return true;
        }
        FakeLauncher& owner_;
        pid_t pid_;
    };

    std::unique_ptr<ProcessHandle> launch(const JobSpec& job) override {
        if (failLaunchAt >= 0 && static_cast<int>(dummies.size()) == failLaunchAt) {
            throw LaunchError("cannot start " + job.argv.front());
        }
        dummies.push_back(job);
        problemOfLaunch.push_back(timings.size());
        liveAtLaunch.push_back(live.size());
        pid_t pid = nextPid++;
        live.insert(pid);
        return std::make_unique<Handle>(*this, pid);
    }

    TimingResult run(const JobSpec& job, OutputMode mode) override {
        timings.push_back(job);
        modes.push_back(mode);
        liveDuringTiming.push_back(live.size());
        TimingResult result;
        result.output = output ? output(job) : std::string("ok\n");
        result.ok = exitCode == 0;
        result.exitCode = exitCode;
        if (!result.ok) result.error = "exited with status " + std::to_string(exitCode);
        return result;
    }

    void reap() noexcept override { ++reapCalls; }

    std::vector<JobSpec> dummies;
    std::vector<JobSpec> timings;
    std::vector<OutputMode> modes;
    std::vector<std::size_t> problemOfLaunch;
    std::vector<std::size_t> liveAtLaunch;
    std::vector<std::size_t> liveDuringTiming;
    std::vector<pid_t> terminated;
    std::set<pid_t> live;
    std::function<std::string(const JobSpec&)> output;
    int exitCode = 0;
    int failLaunchAt = -1;
    int reapCalls = 0;
    pid_t nextPid = 1000;
};

}
