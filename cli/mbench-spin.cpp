/*
 * multibench - Busy-work dummy program (mbench-spin)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "multibench/logger.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace multibench;

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

void printUsage(const char* progName) {
    std::cout << "Usage: " << progName << " [--threads-env <NAME>] [ignored arguments...]\n\n";
    std::cout << "Keeps one busy thread per CPU it was given until it receives SIGTERM or SIGINT.\n";
    std::cout << "The thread count is read from the variable named by --threads-env\n";
    std::cout << "(default OMP_NUM_THREADS) and falls back to 1. Every other argument,\n";
    std::cout << "including problem and --processing-device-id flags, is ignored.\n";
}

int threadCount(const std::string& envName) {
    const char* val = std::getenv(envName.c_str());
    if (!val || !*val) {
        return 1;
    }
    try {
        int n = std::stoi(val);
        return n > 0 ? n : 1;
    } catch (const std::exception&) {
        LOG_WARN("Ignoring invalid " + envName + "=" + val);
        return 1;
    }
}

void spin(const std::atomic<bool>& stop, std::atomic<std::uint64_t>& sink) {
    std::uint64_t x = 88172645463325252ULL;
    while (!stop.load(std::memory_order_relaxed)) {
        for (int i = 0; i < 4096; ++i) {
            x ^= x << 13;
            x ^= x >> 7;
            x ^= x << 17;
        }
        sink.fetch_add(x & 1, std::memory_order_relaxed);
    }
}

int main(int argc, char* argv[]) {
    std::string envName = "OMP_NUM_THREADS";
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "--threads-env" && i + 1 < argc) {
            envName = argv[++i];
        }
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    int nthreads = threadCount(envName);
    LOG_DEBUG("Spinning on " + std::to_string(nthreads) + " thread(s)");

    std::atomic<bool> stop{false};
    std::atomic<std::uint64_t> sink{0};
    std::vector<std::thread> workers;
    workers.reserve(nthreads);
    for (int i = 0; i < nthreads; ++i) {
        workers.emplace_back(spin, std::cref(stop), std::ref(sink));
    }

    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    stop.store(true);
    for (auto& t : workers) {
        t.join();
    }
    LOG_DEBUG("Stopped after signal");
    return 0;
}
