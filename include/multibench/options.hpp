/*
 * multibench - Contention-aware benchmark orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <ostream>

#include "multibench/config.hpp"
#include "multibench/types.hpp"

namespace multibench {

struct Options {
    Config config;
    bool help = false;
    bool version = false;
    bool verbose = false;
};

// Parses the --mbench-* options an entry point understands. List options
// take every following token up to the next one starting with "-". Any
// token not consumed here lands in config.passThrough, in order.
// Throws ConfigurationError on a missing or malformed value.
[[nodiscard]] Options parseOptions(const Tokens& args, EntryPoint entry, Config defaults);
[[nodiscard]] Options parseOptions(int argc, const char* const argv[], EntryPoint entry);

void printUsage(std::ostream& out, const char* progName, EntryPoint entry);

}
