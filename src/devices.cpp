/*
 * multibench - Contention-aware benchmark orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "multibench/devices.hpp"
#include "multibench/binder.hpp"
#include "multibench/config.hpp"
#include "multibench/errors.hpp"
#include "multibench/logger.hpp"
#include <utility>

namespace multibench {

DeviceSet::DeviceSet(AffinityMode mode, std::vector<std::string> cpus, std::vector<int> gpus, int threads)
    : mode_(mode), cpus_(std::move(cpus)), gpus_(std::move(gpus)), threads_(threads) {
}

DeviceSet DeviceSet::resolve(const Config& config) {
    int threads = parseCpuAffinityList(config.cpuAffinityList);

    if (config.mode() == AffinityMode::Gpu) {
        if (config.cpuAffinityList.size() != 1) {
            throw ConfigurationError("When giving a non-empty GPU list the CPU affinity list must have length one");
        }
        LOG_DEBUG("GPU mode: " + std::to_string(config.gpuList.size()) + " devices, cpu binding " +
                  config.cpuAffinityList.front());
        return DeviceSet(AffinityMode::Gpu, config.cpuAffinityList, config.gpuList, threads);
    }

    LOG_DEBUG("CPU mode: " + std::to_string(config.cpuAffinityList.size()) + " devices, " +
              std::to_string(threads) + " threads each");
    return DeviceSet(AffinityMode::Cpu, config.cpuAffinityList, {}, threads);
}

std::size_t DeviceSet::size() const noexcept {
    return mode_ == AffinityMode::Gpu ? gpus_.size() : cpus_.size();
}

DeviceBinding DeviceSet::timingBinding() const {
    return bindingAt(0);
}

std::vector<DeviceBinding> DeviceSet::dummyBindings() const {
    std::vector<DeviceBinding> bindings;
    bindings.reserve(dummyCount());
    for (std::size_t i = 1; i < size(); ++i) {
        bindings.push_back(bindingAt(i));
    }
    return bindings;
}

DeviceBinding DeviceSet::bindingAt(std::size_t index) const {
    if (mode_ == AffinityMode::Gpu) {
        // Every GPU job shares the reference CPU binding
        return {cpus_.front(), gpus_.at(index)};
    }
    return {cpus_.at(index), std::nullopt};
}

}
