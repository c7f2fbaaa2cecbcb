#include <gtest/gtest.h>
#include <cstdlib>

#include "multibench/errors.hpp"
#include "multibench/options.hpp"

using namespace multibench;

TEST(OptionsTest, ParsesOrchestratorOptionsAndKeepsTheRest) {
    Tokens args = {"--size", "1024",
                   "--mbench-cpu-affinity-list", "0,1", "2,3",
                   "--mbench-dummy-program", "spin",
                   "--mbench-timing-program=timer",
                   "--mbench-wait-time", "0.5",
                   "--verbose-fft",
                   "--mbench-affinity-cmd", "taskset",
                   "--mbench-bind-mem", "False",
                   "--mbench-nthreads-env-name", "OMP_NUM_THREADS",
                   "--mbench-input-file", "in.txt",
                   "--mbench-output-file", "out.txt",
                   "--mbench-problem-argstring", "case"};

    Options options = parseOptions(args, EntryPoint::List, Config{});
    const Config& c = options.config;
    EXPECT_EQ(c.cpuAffinityList, (Tokens{"0,1", "2,3"}));
    EXPECT_EQ(c.dummyProgram, "spin");
    EXPECT_EQ(c.timingProgram, "timer");
    EXPECT_DOUBLE_EQ(c.waitTime, 0.5);
    EXPECT_EQ(c.waitInterval().count(), 500);
    EXPECT_EQ(c.affinityCommand, AffinityCommand::Taskset);
    EXPECT_EQ(c.bindMem, BindMem::Off);
    EXPECT_EQ(c.nthreadsEnvName, "OMP_NUM_THREADS");
    EXPECT_EQ(c.inputFile.string(), "in.txt");
    EXPECT_EQ(c.outputFile.string(), "out.txt");
    EXPECT_EQ(c.problemArgString, "case");
    EXPECT_EQ(c.passThrough, (Tokens{"--size", "1024", "--verbose-fft"}));
    EXPECT_FALSE(options.help);
}

TEST(OptionsTest, ListOptionsStopAtShortFlags) {
    Options options = parseOptions({"--mbench-cpu-affinity-list", "0", "1", "-v", "--mbench-gpu-list", "2", "-n", "4"},
                                   EntryPoint::Single, Config{});
    EXPECT_EQ(options.config.cpuAffinityList, (Tokens{"0", "1"}));
    EXPECT_EQ(options.config.gpuList, (std::vector<int>{2}));
    EXPECT_EQ(options.config.passThrough, (Tokens{"-v", "-n", "4"}));
}

TEST(OptionsTest, GpuListAndSchemaArguments) {
    Tokens args = {"--mbench-gpu-list", "1", "0",
                   "--mbench-cpu-affinity-list", "3",
                   "--mbench-problem-args", "freq", "mass",
                   "--mbench-timing-program", "timer"};

    Options options = parseOptions(args, EntryPoint::Schema, Config{});
    EXPECT_EQ(options.config.gpuList, (std::vector<int>{1, 0}));
    EXPECT_EQ(options.config.mode(), AffinityMode::Gpu);
    EXPECT_EQ(options.config.jobCount(), 2u);
    EXPECT_EQ(options.config.problemSchema, (Tokens{"freq", "mass"}));
    EXPECT_TRUE(options.config.passThrough.empty());
}

TEST(OptionsTest, InputOptionsPassThroughForSingleProblemRuns) {
    Tokens args = {"--mbench-input-file", "in.txt", "--mbench-timing-program", "timer"};
    Options options = parseOptions(args, EntryPoint::Single, Config{});
    EXPECT_TRUE(options.config.inputFile.empty());
    EXPECT_EQ(options.config.passThrough, (Tokens{"--mbench-input-file", "in.txt"}));
}

TEST(OptionsTest, RejectsBadValues) {
    EXPECT_THROW((void)parseOptions({"--mbench-wait-time", "soon"}, EntryPoint::Single, Config{}), ConfigurationError);
    EXPECT_THROW((void)parseOptions({"--mbench-gpu-list", "-1"}, EntryPoint::Single, Config{}), ConfigurationError);
    EXPECT_THROW((void)parseOptions({"--mbench-gpu-list", "x"}, EntryPoint::Single, Config{}), ConfigurationError);
    EXPECT_THROW((void)parseOptions({"--mbench-affinity-cmd", "hwloc"}, EntryPoint::Single, Config{}), ConfigurationError);
    EXPECT_THROW((void)parseOptions({"--mbench-bind-mem", "yes"}, EntryPoint::Single, Config{}), ConfigurationError);
    EXPECT_THROW((void)parseOptions({"--mbench-timing-program"}, EntryPoint::Single, Config{}), ConfigurationError);
}

TEST(OptionsTest, HelpVersionAndVerboseFlags) {
    Options options = parseOptions({"-h", "--version", "--mbench-verbose"}, EntryPoint::Single, Config{});
    EXPECT_TRUE(options.help);
    EXPECT_TRUE(options.version);
    EXPECT_TRUE(options.verbose);
}

TEST(OptionsTest, EnvironmentSuppliesDefaults) {
    ::setenv("MBENCH_WAIT_TIME", "2.5", 1);
    ::setenv("MBENCH_AFFINITY_CMD", "taskset", 1);
    ::setenv("MBENCH_NTHREADS_ENV_NAME", "NTHREADS", 1);
    Config config = Config::fromEnvironment();
    ::unsetenv("MBENCH_WAIT_TIME");
    ::unsetenv("MBENCH_AFFINITY_CMD");
    ::unsetenv("MBENCH_NTHREADS_ENV_NAME");

    EXPECT_DOUBLE_EQ(config.waitTime, 2.5);
    EXPECT_EQ(config.affinityCommand, AffinityCommand::Taskset);
    EXPECT_EQ(config.nthreadsEnvName, "NTHREADS");

    Options options = parseOptions({"--mbench-wait-time", "0"}, EntryPoint::Single, config);
    EXPECT_DOUBLE_EQ(options.config.waitTime, 0.0);
    EXPECT_EQ(options.config.affinityCommand, AffinityCommand::Taskset);
}

class ConfigValidateTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.cpuAffinityList = {"0", "1"};
        config_.dummyProgram = "spin";
        config_.timingProgram = "timer";
        config_.inputFile = "in.txt";
        config_.problemSchema = {"n"};
    }

    Config config_;
};

TEST_F(ConfigValidateTest, AcceptsCompleteConfiguration) {
    EXPECT_NO_THROW(config_.validate(EntryPoint::Single));
    EXPECT_NO_THROW(config_.validate(EntryPoint::List));
    EXPECT_NO_THROW(config_.validate(EntryPoint::Schema));
}

TEST_F(ConfigValidateTest, RequiresTimingProgram) {
    config_.timingProgram.clear();
    EXPECT_THROW(config_.validate(EntryPoint::Single), ConfigurationError);
}

TEST_F(ConfigValidateTest, RequiresDummyProgramOnlyWithDummies) {
    config_.dummyProgram.clear();
    EXPECT_THROW(config_.validate(EntryPoint::Single), ConfigurationError);
    config_.cpuAffinityList = {"0"};
    EXPECT_NO_THROW(config_.validate(EntryPoint::Single));
}

TEST_F(ConfigValidateTest, GpuModeNeedsOneCpuSet) {
    config_.gpuList = {0, 1};
    EXPECT_THROW(config_.validate(EntryPoint::Single), ConfigurationError);
    config_.cpuAffinityList = {"0"};
    EXPECT_NO_THROW(config_.validate(EntryPoint::Single));
}

TEST_F(ConfigValidateTest, RejectsNegativeWait) {
    config_.waitTime = -1.0;
    EXPECT_THROW(config_.validate(EntryPoint::Single), ConfigurationError);
}

TEST_F(ConfigValidateTest, RejectsWaitBeyondOneDay) {
    config_.waitTime = kMaxWaitTime;
    EXPECT_NO_THROW(config_.validate(EntryPoint::Single));
    config_.waitTime = 1e300;
    EXPECT_THROW(config_.validate(EntryPoint::Single), ConfigurationError);
    EXPECT_EQ(config_.waitInterval().count(), 86400000);
}

TEST_F(ConfigValidateTest, RejectsTasksetMemoryBinding) {
    config_.affinityCommand = AffinityCommand::Taskset;
    config_.bindMem = BindMem::On;
    EXPECT_THROW(config_.validate(EntryPoint::Single), ConfigurationError);
}

TEST_F(ConfigValidateTest, FileDriversNeedInputAndSchema) {
    config_.problemSchema.clear();
    EXPECT_THROW(config_.validate(EntryPoint::Schema), ConfigurationError);
    EXPECT_NO_THROW(config_.validate(EntryPoint::List));
    config_.inputFile.clear();
    EXPECT_THROW(config_.validate(EntryPoint::List), ConfigurationError);
    EXPECT_NO_THROW(config_.validate(EntryPoint::Single));
}
