/*
 * multibench - Contention-aware benchmark orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <optional>
#include <string>
#include <vector>

#include "multibench/types.hpp"

namespace multibench {

struct Config;

// Where one job runs: the CPU set it is pinned to and, in GPU mode,
// the GPU it targets.
struct DeviceBinding {
    std::string cpuSpec;
    std::optional<int> gpuIndex;
};

// The active device list of a run. Position 0 belongs to the timing job,
// every later position to one dummy job.
class DeviceSet final {
public:
    // Throws ConfigurationError if the affinity list has no coherent thread count.
    [[nodiscard]] static DeviceSet resolve(const Config& config);

    [[nodiscard]] AffinityMode mode() const noexcept { return mode_; }
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] std::size_t dummyCount() const noexcept { return size() - 1; }
    [[nodiscard]] int threadCount() const noexcept { return threads_; }

    [[nodiscard]] DeviceBinding timingBinding() const;
    [[nodiscard]] std::vector<DeviceBinding> dummyBindings() const;

private:
    DeviceSet(AffinityMode mode, std::vector<std::string> cpus, std::vector<int> gpus, int threads);

    [[nodiscard]] DeviceBinding bindingAt(std::size_t index) const;

    AffinityMode mode_;
    std::vector<std::string> cpus_;
    std::vector<int> gpus_;
    int threads_;
};

}
