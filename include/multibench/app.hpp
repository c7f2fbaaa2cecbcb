/*
 * multibench - Contention-aware benchmark orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "multibench/config.hpp"

namespace multibench {

constexpr const char* VERSION = "0.1.0";

// Shared main() of the mbench-single, mbench-list and mbench-schema tools.
int runEntryPoint(int argc, char* argv[], EntryPoint entry);

}
