/*
 * multibench - Contention-aware benchmark orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "multibench/binder.hpp"
#include "multibench/config.hpp"
#include "multibench/errors.hpp"
#include "multibench/logger.hpp"
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <limits>
#include <sstream>
#include <unistd.h>

namespace multibench {

namespace {
int parseCpuId(const std::string& text, const std::string& spec) {
    if (text.empty()) {
        throw ConfigurationError("Malformed cpu affinity '" + spec + "': empty cpu id");
    }
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw ConfigurationError("Malformed cpu affinity '" + spec + "': '" + text + "' is not a cpu id");
        }
    }
    try {
        return std::stoi(text);
    } catch (const std::exception&) {
        throw ConfigurationError("Malformed cpu affinity '" + spec + "': cpu id '" + text + "' out of range");
    }
}
}

ResourceBinder::ResourceBinder(AffinityCommand command, BindMem bindMem)
    : command_(command) {
    switch (command) {
        case AffinityCommand::Numactl:
            affinityPrefix_ = {"numactl", "-C"};
            bindsMemory_ = (bindMem != BindMem::Off);
            if (bindsMemory_) {
                memPrefix_ = {"-l", "--"};
            } else {
                memPrefix_ = {"--"};
            }
            break;
        case AffinityCommand::Taskset:
            if (bindMem == BindMem::On) {
                throw ConfigurationError("You specified 'taskset' and bind-mem True, which is unsupported");
            }
            affinityPrefix_ = {"taskset", "-c"};
            break;
    }
    LOG_DEBUG(std::string("Binding jobs with ") + affinityCommandName(command_) +
              (bindsMemory_ ? " (local memory)" : ""));
}

Affinity ResourceBinder::resolveAffinity(const std::string& cpuSpec) const {
    Affinity affinity;
    affinity.threadCount = cpuCount(cpuSpec);
    affinity.prefix = affinityPrefix_;
    affinity.prefix.push_back(cpuSpec);
    return affinity;
}

bool ResourceBinder::commandAvailable() const noexcept {
    return executableOnPath(affinityCommandName(command_));
}

int cpuCount(const std::string& cpuSpec) {
    if (cpuSpec.empty()) {
        throw ConfigurationError("Malformed cpu affinity: empty specifier");
    }

    long long count = 0;
    std::stringstream ss(cpuSpec);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto dash = item.find('-');
        if (dash == std::string::npos) {
            (void)parseCpuId(item, cpuSpec);
            if (++count > std::numeric_limits<int>::max()) {
                throw ConfigurationError("Malformed cpu affinity '" + cpuSpec + "': too many cpus");
            }
            continue;
        }
        int first = parseCpuId(item.substr(0, dash), cpuSpec);
        int last = parseCpuId(item.substr(dash + 1), cpuSpec);
        if (last < first) {
            throw ConfigurationError("Malformed cpu affinity '" + cpuSpec + "': descending range '" + item + "'");
        }
        count += static_cast<long long>(last) - first + 1;
        if (count > std::numeric_limits<int>::max()) {
            throw ConfigurationError("Malformed cpu affinity '" + cpuSpec + "': too many cpus");
        }
    }

    // getline drops a trailing empty item, so "0,1," needs its own check
    if (cpuSpec.back() == ',') {
        throw ConfigurationError("Malformed cpu affinity '" + cpuSpec + "': empty cpu id");
    }
    return static_cast<int>(count);
}

int parseCpuAffinityList(const std::vector<std::string>& cpuAffinityList) {
    if (cpuAffinityList.empty()) {
        throw ConfigurationError("You must give at least one cpu affinity mask");
    }

    int nthreads = cpuCount(cpuAffinityList.front());
    for (std::size_t i = 1; i < cpuAffinityList.size(); ++i) {
        int n = cpuCount(cpuAffinityList[i]);
        if (n != nthreads) {
            throw ConfigurationError("Each item in --mbench-cpu-affinity-list must list the same number of cpus ('" +
                                     cpuAffinityList.front() + "' has " + std::to_string(nthreads) + ", '" +
                                     cpuAffinityList[i] + "' has " + std::to_string(n) + ")");
        }
    }
    return nthreads;
}

bool executableOnPath(const std::string& name) noexcept {
    try {
        const char* path = std::getenv("PATH");
        if (!path || !*path) {
            return false;
        }
        std::stringstream ss(path);
        std::string dir;
        while (std::getline(ss, dir, ':')) {
            if (dir.empty()) {
                dir = ".";
            }
            auto candidate = std::filesystem::path(dir) / name;
            if (::access(candidate.c_str(), X_OK) == 0) {
                return true;
            }
        }
    } catch (const std::exception& e) {
        LOG_DEBUG("PATH lookup for " + name + " failed: " + e.what());
    }
    return false;
}

}
