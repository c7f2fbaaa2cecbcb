/*
 * multibench - Contention-aware benchmark orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "multibench/app.hpp"
#include "multibench/binder.hpp"
#include "multibench/errors.hpp"
#include "multibench/feed.hpp"
#include "multibench/logger.hpp"
#include "multibench/options.hpp"
#include "multibench/orchestrator.hpp"
#include "multibench/supervisor.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>

namespace multibench {

namespace {
void requireAffinityCommand(const Config& config) {
    ResourceBinder binder(config.affinityCommand, config.bindMem);
    if (!binder.commandAvailable()) {
        throw ConfigurationError(std::string("You specified '") + affinityCommandName(config.affinityCommand) +
                                 "' but that is not available on your PATH");
    }
}
}

int runEntryPoint(int argc, char* argv[], EntryPoint entry) {
    // Default to WARN so records on stdout stay readable; MBENCH_LOG_LEVEL overrides
    if (!std::getenv("MBENCH_LOG_LEVEL"))
        Logger::setLevel(LogLevel::WARN);

    const char* progName = argc > 0 ? argv[0] : entryPointName(entry);

    try {
        Options options = parseOptions(argc, argv, entry);
        if (options.help) {
            printUsage(std::cout, progName, entry);
            return 0;
        }
        if (options.version) {
            std::cout << VERSION << "\n";
            return 0;
        }
        if (argc < 2) {
            printUsage(std::cerr, progName, entry);
            return 1;
        }
        if (options.verbose) {
            Logger::setLevel(LogLevel::DEBUG);
        }

        const Config& config = options.config;
        config.validate(entry);
        requireAffinityCommand(config);

        // Everything that can be checked is checked before the first launch
        auto feed = makeFeed(entry, config);

        std::ofstream outputFile;
        std::ostream* records = nullptr;
        if (entry != EntryPoint::Single) {
            records = config.outputFile.empty() ? static_cast<std::ostream*>(&std::cout) : &outputFile;
        }

        ProcessSupervisor supervisor;
        Orchestrator orchestrator(config, supervisor, records);

        // Truncate only after the device list has been resolved
        if (records == &outputFile) {
            outputFile.open(config.outputFile, std::ios::out | std::ios::trunc);
            if (!outputFile) {
                throw ConfigurationError("Cannot open output file: " + config.outputFile.string());
            }
        }

        RunStats stats = orchestrator.run(*feed);

        LOG_DEBUG(std::to_string(stats.problems) + " problem(s), " + std::to_string(stats.dummiesLaunched) +
                  " dummies launched, " + std::to_string(stats.dummiesSignaled) + " signaled");
        return 0;

    } catch (const Error& e) {
        LOG_ERROR(e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("Unexpected error: " + std::string(e.what()));
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

}
