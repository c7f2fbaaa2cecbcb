/*
 * multibench - Contention-aware benchmark orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <stdexcept>
#include <string>

namespace multibench {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Invalid options or affinity list; raised before anything is launched.
class ConfigurationError : public Error {
public:
    using Error::Error;
};

// Malformed or unreadable problem input file.
class InputValidationError : public Error {
public:
    using Error::Error;
};

// The OS refused to start a process.
class LaunchError : public Error {
public:
    using Error::Error;
};

}
