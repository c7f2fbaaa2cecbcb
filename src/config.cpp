/*
 * multibench - Contention-aware benchmark orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "multibench/config.hpp"
#include "multibench/errors.hpp"
#include "multibench/logger.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace multibench {

namespace {
const char* env_string(const char* name) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return nullptr;
    }
    return val;
}
}

std::chrono::milliseconds Config::waitInterval() const noexcept {
    if (!(waitTime > 0.0)) {
        return std::chrono::milliseconds(0);
    }
    double seconds = std::min(waitTime, kMaxWaitTime);
    return std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000.0)));
}

void Config::validate(EntryPoint entry) const {
    if (timingProgram.empty()) {
        throw ConfigurationError("--mbench-timing-program is required");
    }

    if (mode() == AffinityMode::Gpu) {
        if (cpuAffinityList.size() != 1) {
            throw ConfigurationError("When giving a non-empty GPU list the CPU affinity list must have length one");
        }
        for (int gpu : gpuList) {
            if (gpu < 0) {
                throw ConfigurationError("GPU indices must be non-negative, got " + std::to_string(gpu));
            }
        }
    } else if (cpuAffinityList.empty()) {
        throw ConfigurationError("You must give at least one cpu affinity mask");
    }

    if (jobCount() > 1 && dummyProgram.empty()) {
        throw ConfigurationError("--mbench-dummy-program is required when more than one job is configured");
    }

    if (!std::isfinite(waitTime) || waitTime < 0.0) {
        throw ConfigurationError("--mbench-wait-time must be a non-negative number of seconds");
    }
    if (waitTime > kMaxWaitTime) {
        throw ConfigurationError("--mbench-wait-time must be at most " + std::to_string(static_cast<long>(kMaxWaitTime)) +
                                 " seconds");
    }

    if (affinityCommand == AffinityCommand::Taskset && bindMem == BindMem::On) {
        throw ConfigurationError("taskset cannot bind memory; use numactl or --mbench-bind-mem False");
    }

    if (entry != EntryPoint::Single) {
        if (inputFile.empty()) {
            throw ConfigurationError("--mbench-input-file is required by " + std::string(entryPointName(entry)));
        }
        if (problemArgString.empty()) {
            throw ConfigurationError("--mbench-problem-argstring must not be empty");
        }
    }

    if (entry == EntryPoint::Schema && problemSchema.empty()) {
        throw ConfigurationError("--mbench-problem-args must name at least one argument");
    }
}

Config Config::fromEnvironment() {
    Config config;

    if (const char* wait = env_string("MBENCH_WAIT_TIME")) {
        try {
            config.waitTime = std::stod(wait);
        } catch (const std::exception&) {
            LOG_WARN("Ignoring invalid MBENCH_WAIT_TIME: " + std::string(wait));
        }
    }
    if (const char* cmd = env_string("MBENCH_AFFINITY_CMD")) {
        config.affinityCommand = parseAffinityCommand(cmd);
    }
    if (const char* name = env_string("MBENCH_NTHREADS_ENV_NAME")) {
        config.nthreadsEnvName = name;
    }

    return config;
}

AffinityCommand parseAffinityCommand(const std::string& value) {
    if (value == "numactl") return AffinityCommand::Numactl;
    if (value == "taskset") return AffinityCommand::Taskset;
    throw ConfigurationError("affinity command must be one of 'numactl' or 'taskset', got '" + value + "'");
}

BindMem parseBindMem(const std::string& value) {
    if (value == "None") return BindMem::Unset;
    if (value == "True") return BindMem::On;
    if (value == "False") return BindMem::Off;
    throw ConfigurationError("--mbench-bind-mem must be one of None, True, False, got '" + value + "'");
}

const char* affinityCommandName(AffinityCommand command) noexcept {
    switch (command) {
        case AffinityCommand::Numactl: return "numactl";
        case AffinityCommand::Taskset: return "taskset";
        default: return "unknown";
    }
}

const char* entryPointName(EntryPoint entry) noexcept {
    switch (entry) {
        case EntryPoint::Single: return "mbench-single";
        case EntryPoint::List: return "mbench-list";
        case EntryPoint::Schema: return "mbench-schema";
        default: return "mbench";
    }
}

}
