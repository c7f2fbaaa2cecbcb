/*
 * multibench - Contention-aware benchmark orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>

#include "multibench/devices.hpp"
#include "multibench/types.hpp"

namespace multibench {

struct Config;
class ResourceBinder;

constexpr const char* kDeviceIdFlag = "--processing-device-id";

// Everything needed to start one process. Built once, never modified.
struct JobSpec {
    JobRole role = JobRole::Timing;
    DeviceBinding binding;
    Tokens argv;
    // Added on top of the orchestrator's own environment
    Environment envOverlay;
};

class JobBuilder final {
public:
    JobBuilder(const Config& config, const ResourceBinder& binder, AffinityMode mode) noexcept;

    // argv order: affinity prefix, memory prefix, program, problem tokens,
    // pass-through tokens, device id (GPU mode only).
    [[nodiscard]] JobSpec build(JobRole role, const DeviceBinding& binding, const Tokens& problem) const;

private:
    const Config& config_;
    const ResourceBinder& binder_;
    AffinityMode mode_;
};

[[nodiscard]] const char* roleName(JobRole role) noexcept;

// Space-joined argv for log lines.
[[nodiscard]] std::string describe(const JobSpec& job);

}
