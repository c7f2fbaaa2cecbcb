/*
 * multibench - Contention-aware benchmark orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "multibench/job.hpp"
#include "multibench/binder.hpp"
#include "multibench/config.hpp"
#include "multibench/errors.hpp"

namespace multibench {

JobBuilder::JobBuilder(const Config& config, const ResourceBinder& binder, AffinityMode mode) noexcept
    : config_(config), binder_(binder), mode_(mode) {
}

JobSpec JobBuilder::build(JobRole role, const DeviceBinding& binding, const Tokens& problem) const {
    JobSpec job;
    job.role = role;
    job.binding = binding;

    Affinity affinity = binder_.resolveAffinity(binding.cpuSpec);
    const Tokens& mem = binder_.memBindingPrefix();
    const std::string& program = (role == JobRole::Dummy) ? config_.dummyProgram : config_.timingProgram;

    job.argv.reserve(affinity.prefix.size() + mem.size() + 1 + problem.size() +
                     config_.passThrough.size() + 2);
    job.argv.insert(job.argv.end(), affinity.prefix.begin(), affinity.prefix.end());
    job.argv.insert(job.argv.end(), mem.begin(), mem.end());
    job.argv.push_back(program);
    job.argv.insert(job.argv.end(), problem.begin(), problem.end());
    job.argv.insert(job.argv.end(), config_.passThrough.begin(), config_.passThrough.end());

    if (mode_ == AffinityMode::Gpu) {
        if (!binding.gpuIndex) {
            throw ConfigurationError("GPU mode job built without a GPU index");
        }
        job.argv.push_back(kDeviceIdFlag);
        job.argv.push_back(std::to_string(*binding.gpuIndex));
    } else if (!config_.nthreadsEnvName.empty()) {
        job.envOverlay[config_.nthreadsEnvName] = std::to_string(affinity.threadCount);
    }

    return job;
}

const char* roleName(JobRole role) noexcept {
    switch (role) {
        case JobRole::Dummy: return "dummy";
        case JobRole::Timing: return "timing";
        default: return "unknown";
    }
}

std::string describe(const JobSpec& job) {
    std::string out;
    for (const auto& [name, value] : job.envOverlay) {
        out += name + "=" + value + " ";
    }
    for (std::size_t i = 0; i < job.argv.size(); ++i) {
        if (i > 0) out += ' ';
        out += job.argv[i];
    }
    return out;
}

}
