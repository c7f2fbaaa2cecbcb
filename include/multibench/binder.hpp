/*
 * multibench - Contention-aware benchmark orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>
#include <vector>

#include "multibench/types.hpp"

namespace multibench {

struct Affinity {
    int threadCount = 0;
    Tokens prefix;
};

// Turns CPU affinity specifiers into the command prefix that pins a
// process (numactl -C / taskset -c) and the memory binding that follows it.
class ResourceBinder final {
public:
    ResourceBinder(AffinityCommand command, BindMem bindMem);

    [[nodiscard]] Affinity resolveAffinity(const std::string& cpuSpec) const;
    [[nodiscard]] const Tokens& memBindingPrefix() const noexcept { return memPrefix_; }

    [[nodiscard]] AffinityCommand command() const noexcept { return command_; }
    [[nodiscard]] bool bindsMemory() const noexcept { return bindsMemory_; }

    // True when the binding command can be found on PATH.
    [[nodiscard]] bool commandAvailable() const noexcept;

private:
    AffinityCommand command_;
    bool bindsMemory_ = false;
    Tokens affinityPrefix_;
    Tokens memPrefix_;
};

// Number of CPUs named by "0,2,4-7" style specifiers.
// Throws ConfigurationError on empty items, bad numbers or descending ranges.
[[nodiscard]] int cpuCount(const std::string& cpuSpec);

// Thread count shared by every entry of the list.
// Throws ConfigurationError when the list is empty or entries disagree.
[[nodiscard]] int parseCpuAffinityList(const std::vector<std::string>& cpuAffinityList);

[[nodiscard]] bool executableOnPath(const std::string& name) noexcept;

}
