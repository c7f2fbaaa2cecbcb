/*
 * multibench - Contention-aware benchmark orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <ostream>

#include "multibench/binder.hpp"
#include "multibench/devices.hpp"
#include "multibench/job.hpp"
#include "multibench/types.hpp"

namespace multibench {

struct Config;
class Launcher;
class ProblemFeed;
struct TimingResult;

// Per-problem lifecycle: Idle -> DummiesLaunching -> TimingRunning -> TearingDown -> Idle
enum class Phase : uint8_t {
    Idle,
    DummiesLaunching,
    TimingRunning,
    TearingDown
};

struct RunStats {
    std::size_t problems = 0;
    std::size_t dummiesLaunched = 0;
    std::size_t dummiesSignaled = 0;
    std::size_t failedTimingRuns = 0;
};

class Orchestrator final {
public:
    // records == nullptr leaves the timing job's stdout inherited.
    // Throws ConfigurationError before anything is launched.
    Orchestrator(const Config& config, Launcher& launcher, std::ostream* records);

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;
    Orchestrator(Orchestrator&&) = delete;
    Orchestrator& operator=(Orchestrator&&) = delete;

    // Runs every problem of the feed in order. Exceptions abort the run
    // after the current problem's dummies have been signaled.
    RunStats run(ProblemFeed& feed);

    [[nodiscard]] const DeviceSet& devices() const noexcept { return devices_; }
    [[nodiscard]] Phase phase() const noexcept { return phase_; }
    [[nodiscard]] const RunStats& stats() const noexcept { return stats_; }

private:
    void runProblem(const Tokens& problem);
    void record(const TimingResult& result);

    const Config& config_;
    ResourceBinder binder_;
    DeviceSet devices_;
    JobBuilder builder_;
    Launcher& launcher_;
    std::ostream* records_;

    Phase phase_ = Phase::Idle;
    RunStats stats_;
};

[[nodiscard]] const char* phaseName(Phase phase) noexcept;

}
