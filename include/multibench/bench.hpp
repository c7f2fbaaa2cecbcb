/*
 * multibench - Contention-aware benchmark orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "multibench/types.hpp"

namespace multibench {

// Base for the workload inside a timing program. Derived classes do their
// untimed preparation in the constructor, timed preparation in doSetup()
// and one unit of work in execute().
class BenchProblem {
public:
    virtual ~BenchProblem() = default;

    virtual void execute() = 0;

    // Runs doSetup() and records how long it took.
    void setup();
    [[nodiscard]] double setupTime() const noexcept { return setupTime_; }

    // Smallest n in 10, 100, ..., 1e9 for which n calls to execute() take
    // longer than `seconds`.
    [[nodiscard]] std::uint64_t neededIterations(double seconds);

    // Wall time of n calls to execute(), in seconds.
    [[nodiscard]] double time(std::uint64_t n);

protected:
    virtual void doSetup() {}

private:
    double setupTime_ = 0.0;
};

// Renders times in the unit picked from the first entry (s, ms, us or ns).
[[nodiscard]] std::vector<std::string> formatTimes(const std::vector<double>& seconds);

struct TimingOptions {
    double minTime = 1.0;
    int repeats = 8;
};

// Consumes --mbench-time and --mbench-repeats from args, leaving the rest.
// Throws ConfigurationError on a malformed value.
[[nodiscard]] TimingOptions parseTimingOptions(Tokens& args);

}
