/*
 * multibench - Sample timing program (mbench-loop)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "multibench/bench.hpp"
#include "multibench/errors.hpp"
#include "multibench/logger.hpp"
#include <cstddef>
#include <iostream>
#include <string>
#include <vector>

using namespace multibench;

// y = a*x + y over a vector of the problem size
class Saxpy final : public BenchProblem {
public:
    explicit Saxpy(std::size_t n) : n_(n) {}

    void execute() override {
        for (std::size_t i = 0; i < n_; ++i) {
            y_[i] = a_ * x_[i] + y_[i];
        }
    }

protected:
    void doSetup() override {
        x_.assign(n_, 1.0f);
        y_.assign(n_, 2.0f);
    }

private:
    std::size_t n_;
    float a_ = 0.5f;
    std::vector<float> x_;
    std::vector<float> y_;
};

void printUsage(const char* progName) {
    std::cout << "Usage: " << progName << " [--problem <n>] [--mbench-time <s>] [--mbench-repeats <n>]\n\n";
    std::cout << "Times a saxpy loop over n floats (default 1048576) and prints one line:\n";
    std::cout << "the problem size followed by the time per call of every repeat.\n";
}

int main(int argc, char* argv[]) {
    Tokens args(argv + 1, argv + argc);
    for (const auto& arg : args) {
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
    }

    try {
        TimingOptions timing = parseTimingOptions(args);

        std::size_t n = std::size_t(1) << 20;
        for (std::size_t i = 0; i + 1 < args.size(); ++i) {
            if (args[i] == "--problem") {
                n = static_cast<std::size_t>(std::stoull(args[i + 1]));
            }
        }
        if (n == 0) {
            throw ConfigurationError("--problem must be positive");
        }

        Saxpy problem(n);
        problem.setup();
        std::uint64_t iterations = problem.neededIterations(timing.minTime);
        LOG_DEBUG("Setup " + std::to_string(problem.setupTime()) + " s, " +
                  std::to_string(iterations) + " iterations per repeat");

        std::vector<double> perCall;
        perCall.reserve(timing.repeats);
        for (int r = 0; r < timing.repeats; ++r) {
            perCall.push_back(problem.time(iterations) / static_cast<double>(iterations));
        }

        std::cout << n;
        for (const auto& t : formatTimes(perCall)) {
            std::cout << "  " << t;
        }
        std::cout << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
