/*
 * multibench - Contention-aware benchmark orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace multibench {

// Which kind of device the active list holds for this run.
enum class AffinityMode : std::uint8_t { Cpu, Gpu };

enum class JobRole : std::uint8_t { Dummy, Timing };

enum class AffinityCommand : std::uint8_t { Numactl, Taskset };

// Unset follows the command: numactl binds memory, taskset cannot.
enum class BindMem : std::uint8_t { Unset, On, Off };

using Tokens = std::vector<std::string>;
using Environment = std::map<std::string, std::string>;

} // namespace multibench
