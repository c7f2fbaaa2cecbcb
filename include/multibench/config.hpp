/*
 * multibench - Contention-aware benchmark orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "multibench/types.hpp"

namespace multibench {

// Longest accepted --mbench-wait-time, in seconds
constexpr double kMaxWaitTime = 86400.0;

// Which driver is running; fixes how problems are read and encoded.
enum class EntryPoint : uint8_t {
    Single = 0,
    List = 1,
    Schema = 2
};

// Run configuration. Built once from the command line, then only read.
struct Config {
    std::vector<std::string> cpuAffinityList;
    std::vector<int> gpuList;

    std::string dummyProgram;
    std::string timingProgram;
    std::string nthreadsEnvName;

    double waitTime = 10.0; // seconds between dummy launches
    AffinityCommand affinityCommand = AffinityCommand::Numactl;
    BindMem bindMem = BindMem::Unset;

    std::filesystem::path inputFile;
    std::filesystem::path outputFile;
    std::string problemArgString = "problem";
    std::vector<std::string> problemSchema;

    // Tokens not recognized by the option parser, forwarded to every program
    Tokens passThrough;

    [[nodiscard]] AffinityMode mode() const noexcept {
        return gpuList.empty() ? AffinityMode::Cpu : AffinityMode::Gpu;
    }
    [[nodiscard]] std::size_t jobCount() const noexcept {
        return mode() == AffinityMode::Gpu ? gpuList.size() : cpuAffinityList.size();
    }
    [[nodiscard]] std::chrono::milliseconds waitInterval() const noexcept;

    // Throws ConfigurationError describing the first problem found.
    void validate(EntryPoint entry) const;

    // Defaults taken from MBENCH_WAIT_TIME, MBENCH_AFFINITY_CMD and
    // MBENCH_NTHREADS_ENV_NAME; the command line overrides them.
    [[nodiscard]] static Config fromEnvironment();
};

[[nodiscard]] AffinityCommand parseAffinityCommand(const std::string& value);
[[nodiscard]] BindMem parseBindMem(const std::string& value);
[[nodiscard]] const char* affinityCommandName(AffinityCommand command) noexcept;
[[nodiscard]] const char* entryPointName(EntryPoint entry) noexcept;

}
