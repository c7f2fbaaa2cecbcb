/*
 * multibench - Contention-aware benchmark orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "multibench/orchestrator.hpp"
#include "multibench/config.hpp"
#include "multibench/errors.hpp"
#include "multibench/feed.hpp"
#include "multibench/logger.hpp"
#include "multibench/supervisor.hpp"
#include <chrono>
#include <thread>

namespace multibench {

namespace {
std::string joinTokens(const Tokens& tokens) {
    std::string out;
    for (const auto& t : tokens) {
        if (!out.empty()) out += ' ';
        out += t;
    }
    return out;
}

std::string trimTrailingNewlines(std::string text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }
    return text;
}
}

Orchestrator::Orchestrator(const Config& config, Launcher& launcher, std::ostream* records)
    : config_(config),
      binder_(config.affinityCommand, config.bindMem),
      devices_(DeviceSet::resolve(config)),
      builder_(config_, binder_, devices_.mode()),
      launcher_(launcher),
      records_(records) {
    if (devices_.dummyCount() > 0 && config_.dummyProgram.empty()) {
        throw ConfigurationError("--mbench-dummy-program is required when more than one job is configured");
    }
    LOG_DEBUG("Orchestrator ready: " + std::to_string(devices_.dummyCount()) + " dummies per problem, wait " +
              std::to_string(config_.waitInterval().count()) + " ms");
}

RunStats Orchestrator::run(ProblemFeed& feed) {
    stats_ = RunStats{};

    while (auto problem = feed.next()) {
        launcher_.reap();
        LOG_INFO("Problem " + std::to_string(stats_.problems + 1) +
                 (problem->empty() ? std::string() : ": " + joinTokens(*problem)));
        runProblem(*problem);
        ++stats_.problems;
    }

    launcher_.reap();
    LOG_INFO("Finished " + std::to_string(stats_.problems) + " problem(s), " +
             std::to_string(stats_.failedTimingRuns) + " timing failure(s)");
    return stats_;
}

void Orchestrator::runProblem(const Tokens& problem) {
    DummyGroup dummies;

    // Leave the phase at Idle however this iteration ends
    struct PhaseReset {
        Phase& phase;
        ~PhaseReset() { phase = Phase::Idle; }
    } reset{phase_};

    phase_ = Phase::DummiesLaunching;
    const auto wait = config_.waitInterval();
    for (const auto& binding : devices_.dummyBindings()) {
        JobSpec job = builder_.build(JobRole::Dummy, binding, problem);
        dummies.add(launcher_.launch(job));
        ++stats_.dummiesLaunched;
        LOG_DEBUG("Dummy " + std::to_string(dummies.size()) + "/" + std::to_string(devices_.dummyCount()) +
                  " running on " + binding.cpuSpec +
                  (binding.gpuIndex ? " gpu " + std::to_string(*binding.gpuIndex) : std::string()));
        if (wait.count() > 0) {
            std::this_thread::sleep_for(wait);
        }
    }

    phase_ = Phase::TimingRunning;
    JobSpec timing = builder_.build(JobRole::Timing, devices_.timingBinding(), problem);
    TimingResult result = launcher_.run(timing, records_ ? OutputMode::Capture : OutputMode::Inherit);

    phase_ = Phase::TearingDown;
    stats_.dummiesSignaled += dummies.terminateAll();

    if (!result.ok) {
        ++stats_.failedTimingRuns;
        LOG_WARN("Timing job failed (" + result.error + "), recording its output anyway");
    }
    record(result);
}

void Orchestrator::record(const TimingResult& result) {
    if (!records_) {
        return;
    }
    *records_ << trimTrailingNewlines(result.output) << '\n';
    records_->flush();
    if (!*records_) {
        throw Error("Failed to write benchmark output");
    }
}

const char* phaseName(Phase phase) noexcept {
    switch (phase) {
        case Phase::Idle: return "idle";
        case Phase::DummiesLaunching: return "dummies-launching";
        case Phase::TimingRunning: return "timing-running";
        case Phase::TearingDown: return "tearing-down";
        default: return "unknown";
    }
}

}
