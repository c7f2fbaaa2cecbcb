/*
 * multibench - Schema problem driver (mbench-schema)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "multibench/app.hpp"

int main(int argc, char* argv[]) {
    return multibench::runEntryPoint(argc, argv, multibench::EntryPoint::Schema);
}
