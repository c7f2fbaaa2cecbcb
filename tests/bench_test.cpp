#include <gtest/gtest.h>

#include "multibench/bench.hpp"
#include "multibench/errors.hpp"

using namespace multibench;

namespace {
class CountingProblem final : public BenchProblem {
public:
    void execute() override { ++calls; }
    int calls = 0;
    int setups = 0;

protected:
    void doSetup() override { ++setups; }
};
}

TEST(BenchProblemTest, SetupRunsOnceAndIsTimed) {
    CountingProblem problem;
    problem.setup();
    EXPECT_EQ(problem.setups, 1);
    EXPECT_GE(problem.setupTime(), 0.0);
}

TEST(BenchProblemTest, NeededIterationsStopsAtFirstLongEnoughRun) {
    CountingProblem problem;
    EXPECT_EQ(problem.neededIterations(-1.0), 10u);
    EXPECT_EQ(problem.calls, 10);
}

TEST(BenchProblemTest, TimeRunsExactlyN) {
    CountingProblem problem;
    (void)problem.time(25);
    EXPECT_EQ(problem.calls, 25);
}

TEST(FormatTimesTest, UnitComesFromFirstTime) {
    EXPECT_EQ(formatTimes({2.5, 0.5}), (std::vector<std::string>{"2.5 s", "0.5 s"}));
    EXPECT_EQ(formatTimes({0.0025, 0.01}), (std::vector<std::string>{"2.5 ms", "10 ms"}));
    EXPECT_EQ(formatTimes({4e-6}), (std::vector<std::string>{"4 us"}));
    EXPECT_EQ(formatTimes({3e-9}), (std::vector<std::string>{"3 ns"}));
    EXPECT_TRUE(formatTimes({}).empty());
}

TEST(TimingOptionsTest, ConsumesOnlyTimingFlags) {
    Tokens args = {"--problem", "64", "--mbench-time", "0.25", "--mbench-repeats", "3", "--x"};
    TimingOptions options = parseTimingOptions(args);
    EXPECT_DOUBLE_EQ(options.minTime, 0.25);
    EXPECT_EQ(options.repeats, 3);
    EXPECT_EQ(args, (Tokens{"--problem", "64", "--x"}));
}

TEST(TimingOptionsTest, DefaultsAndErrors) {
    Tokens none;
    TimingOptions defaults = parseTimingOptions(none);
    EXPECT_DOUBLE_EQ(defaults.minTime, 1.0);
    EXPECT_EQ(defaults.repeats, 8);

    Tokens bad = {"--mbench-repeats", "0"};
    EXPECT_THROW((void)parseTimingOptions(bad), ConfigurationError);
    Tokens junk = {"--mbench-time", "1s"};
    EXPECT_THROW((void)parseTimingOptions(junk), ConfigurationError);
    Tokens missing = {"--mbench-time"};
    EXPECT_THROW((void)parseTimingOptions(missing), ConfigurationError);
}
