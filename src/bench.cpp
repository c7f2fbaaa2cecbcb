/*
 * multibench - Contention-aware benchmark orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "multibench/bench.hpp"
#include "multibench/errors.hpp"
#include <chrono>
#include <cstdio>

namespace multibench {

void BenchProblem::setup() {
    auto start = std::chrono::steady_clock::now();
    doSetup();
    setupTime_ = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

double BenchProblem::time(std::uint64_t n) {
    auto start = std::chrono::steady_clock::now();
    for (std::uint64_t i = 0; i < n; ++i) {
        execute();
    }
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

std::uint64_t BenchProblem::neededIterations(double seconds) {
    std::uint64_t n = 1;
    for (int i = 1; i < 10; ++i) {
        n *= 10;
        if (time(n) > seconds) {
            break;
        }
    }
    return n;
}

std::vector<std::string> formatTimes(const std::vector<double>& seconds) {
    std::vector<std::string> out;
    if (seconds.empty()) {
        return out;
    }

    const double base = seconds.front();
    double factor = 1.0;
    const char* unit = "s";
    if (base >= 1.0) {
        factor = 1.0;
        unit = "s";
    } else if (base >= 1.0e-3) {
        factor = 1.0e3;
        unit = "ms";
    } else if (base >= 1.0e-6) {
        factor = 1.0e6;
        unit = "us";
    } else {
        factor = 1.0e9;
        unit = "ns";
    }

    out.reserve(seconds.size());
    for (double t : seconds) {
        char buf[64];
        std::snprintf(buf, sizeof(buf), "%g %s", t * factor, unit);
        out.emplace_back(buf);
    }
    return out;
}

TimingOptions parseTimingOptions(Tokens& args) {
    TimingOptions options;
    Tokens rest;
    rest.reserve(args.size());

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg != "--mbench-time" && arg != "--mbench-repeats") {
            rest.push_back(arg);
            continue;
        }
        if (i + 1 >= args.size()) {
            throw ConfigurationError(arg + " requires a value");
        }
        const std::string& value = args[++i];
        try {
            std::size_t used = 0;
            if (arg == "--mbench-time") {
                options.minTime = std::stod(value, &used);
            } else {
                options.repeats = std::stoi(value, &used);
            }
            if (used != value.size()) {
                throw ConfigurationError(arg + ": trailing characters in '" + value + "'");
            }
        } catch (const ConfigurationError&) {
            throw;
        } catch (const std::exception&) {
            throw ConfigurationError(arg + ": invalid value '" + value + "'");
        }
    }

    if (options.repeats < 1) {
        throw ConfigurationError("--mbench-repeats must be at least 1");
    }
    args.swap(rest);
    return options;
}

}
