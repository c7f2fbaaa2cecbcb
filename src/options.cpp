/*
 * multibench - Contention-aware benchmark orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "multibench/options.hpp"
#include "multibench/errors.hpp"
#include <algorithm>
#include <iterator>
#include <optional>
#include <utility>

namespace multibench {

namespace {
constexpr const char* kPrefix = "--mbench-";

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

bool isListOption(const std::string& name, EntryPoint entry) {
    if (name == "cpu-affinity-list" || name == "gpu-list") return true;
    return entry == EntryPoint::Schema && name == "problem-args";
}

bool isValueOption(const std::string& name, EntryPoint entry) {
    static const char* const common[] = {
        "dummy-program", "timing-program", "nthreads-env-name",
        "wait-time", "affinity-cmd", "bind-mem"
    };
    static const char* const io[] = {"input-file", "output-file", "problem-argstring"};

    if (std::find(std::begin(common), std::end(common), name) != std::end(common)) return true;
    if (entry == EntryPoint::Single) return false;
    return std::find(std::begin(io), std::end(io), name) != std::end(io);
}

int parseGpuIndex(const std::string& value) {
    std::size_t used = 0;
    int index = -1;
    try {
        index = std::stoi(value, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used != value.size() || index < 0) {
        throw ConfigurationError("--mbench-gpu-list entries must be non-negative integers, got '" + value + "'");
    }
    return index;
}

double parseSeconds(const std::string& value) {
    std::size_t used = 0;
    double seconds = 0.0;
    try {
        seconds = std::stod(value, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used != value.size()) {
        throw ConfigurationError("--mbench-wait-time expects seconds, got '" + value + "'");
    }
    return seconds;
}

void applyValue(Config& config, const std::string& name, const std::string& value) {
    if (name == "dummy-program") config.dummyProgram = value;
    else if (name == "timing-program") config.timingProgram = value;
    else if (name == "nthreads-env-name") config.nthreadsEnvName = value;
    else if (name == "wait-time") config.waitTime = parseSeconds(value);
    else if (name == "affinity-cmd") config.affinityCommand = parseAffinityCommand(value);
    else if (name == "bind-mem") config.bindMem = parseBindMem(value);
    else if (name == "input-file") config.inputFile = value;
    else if (name == "output-file") config.outputFile = value;
    else if (name == "problem-argstring") config.problemArgString = value;
}

void applyList(Config& config, const std::string& name, const Tokens& values) {
    if (name == "cpu-affinity-list") {
        config.cpuAffinityList = values;
    } else if (name == "gpu-list") {
        config.gpuList.clear();
        for (const auto& v : values) {
            config.gpuList.push_back(parseGpuIndex(v));
        }
    } else if (name == "problem-args") {
        config.problemSchema = values;
    }
}
}

Options parseOptions(const Tokens& args, EntryPoint entry, Config defaults) {
    Options options;
    options.config = std::move(defaults);
    Config& config = options.config;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "-h" || arg == "--help") {
            options.help = true;
            continue;
        }
        if (arg == "--version") {
            options.version = true;
            continue;
        }
        if (!startsWith(arg, kPrefix)) {
            config.passThrough.push_back(arg);
            continue;
        }

        std::string name = arg.substr(std::string(kPrefix).size());
        std::optional<std::string> inlineValue;
        if (auto eq = name.find('='); eq != std::string::npos) {
            inlineValue = name.substr(eq + 1);
            name.erase(eq);
        }

        if (name == "verbose" && !inlineValue) {
            options.verbose = true;
        } else if (isListOption(name, entry)) {
            Tokens values;
            if (inlineValue) {
                values.push_back(*inlineValue);
            }
            while (i + 1 < args.size() && !startsWith(args[i + 1], "-")) {
                values.push_back(args[++i]);
            }
            applyList(config, name, values);
        } else if (isValueOption(name, entry)) {
            if (inlineValue) {
                applyValue(config, name, *inlineValue);
            } else if (i + 1 < args.size()) {
                applyValue(config, name, args[++i]);
            } else {
                throw ConfigurationError(arg + " requires a value");
            }
        } else {
            config.passThrough.push_back(arg);
        }
    }

    return options;
}

Options parseOptions(int argc, const char* const argv[], EntryPoint entry) {
    Tokens args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parseOptions(args, entry, Config::fromEnvironment());
}

void printUsage(std::ostream& out, const char* progName, EntryPoint entry) {
    out << "Usage: " << progName << " --mbench-timing-program <path> --mbench-cpu-affinity-list <cpus>...\n";
    out << "       [options] [program arguments...]\n\n";
    switch (entry) {
        case EntryPoint::Single:
            out << "Runs the timing program once while dummy programs load the remaining devices.\n\n";
            break;
        case EntryPoint::List:
            out << "Runs the timing program once per line of the input file, passing the line as\n";
            out << "--<problem-argstring> <line>, and writes one output line per problem.\n\n";
            break;
        case EntryPoint::Schema:
            out << "Runs the timing program once per row of the input file. Each row holds one\n";
            out << "value per name in --mbench-problem-args, passed as --<name> <value>.\n\n";
            break;
    }
    out << "Devices:\n";
    out << "  --mbench-cpu-affinity-list <spec>...  CPU sets, one per job (e.g. 0,1 2-3). The first\n";
    out << "                                        runs the timing job, the rest run dummies\n";
    out << "  --mbench-gpu-list <id>...             GPU ids, one per job; needs exactly one CPU set\n";
    out << "  --mbench-affinity-cmd <cmd>           numactl (default) or taskset\n";
    out << "  --mbench-bind-mem <None|True|False>   Bind memory to the local node (numactl only)\n\n";
    out << "Programs:\n";
    out << "  --mbench-timing-program <path>        Program whose stdout is the measurement\n";
    out << "  --mbench-dummy-program <path>         Busy-work program, stopped with SIGTERM\n";
    out << "  --mbench-nthreads-env-name <name>     Variable that receives the thread count\n";
    out << "  --mbench-wait-time <seconds>          Delay after each dummy launch (default 10)\n";
    if (entry != EntryPoint::Single) {
        out << "\nInput/output:\n";
        out << "  --mbench-input-file <path>            Problems, one per line ('#' starts a comment)\n";
        out << "  --mbench-output-file <path>           Output records (default: stdout)\n";
        out << "  --mbench-problem-argstring <name>     Problem flag without dashes (default: problem)\n";
    }
    if (entry == EntryPoint::Schema) {
        out << "  --mbench-problem-args <name>...       Names of the columns of each input row\n";
    }
    out << "\nOther:\n";
    out << "  --mbench-verbose                      Debug logging\n";
    out << "  -h, --help                            Show this help message\n";
    out << "  --version                             Show version\n\n";
    out << "Unrecognized arguments are passed on to both programs.\n\n";
    out << "Environment Variables:\n";
    out << "  MBENCH_LOG_LEVEL          Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
    out << "  MBENCH_WAIT_TIME          Default for --mbench-wait-time\n";
    out << "  MBENCH_AFFINITY_CMD       Default for --mbench-affinity-cmd\n";
    out << "  MBENCH_NTHREADS_ENV_NAME  Default for --mbench-nthreads-env-name\n";
}

}
