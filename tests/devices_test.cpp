#include <gtest/gtest.h>

#include "multibench/config.hpp"
#include "multibench/devices.hpp"
#include "multibench/errors.hpp"

using namespace multibench;

TEST(DeviceSetTest, CpuModeUsesHeadForTimingAndTailForDummies) {
    Config config;
    config.cpuAffinityList = {"0,1", "2,3", "4,5"};

    DeviceSet devices = DeviceSet::resolve(config);
    EXPECT_EQ(devices.mode(), AffinityMode::Cpu);
    EXPECT_EQ(devices.size(), 3u);
    EXPECT_EQ(devices.dummyCount(), 2u);
    EXPECT_EQ(devices.threadCount(), 2);

    EXPECT_EQ(devices.timingBinding().cpuSpec, "0,1");
    EXPECT_FALSE(devices.timingBinding().gpuIndex.has_value());

    auto dummies = devices.dummyBindings();
    ASSERT_EQ(dummies.size(), 2u);
    EXPECT_EQ(dummies[0].cpuSpec, "2,3");
    EXPECT_EQ(dummies[1].cpuSpec, "4,5");
}

TEST(DeviceSetTest, GpuModePinsEveryJobToTheReferenceCpu) {
    Config config;
    config.cpuAffinityList = {"6"};
    config.gpuList = {2, 0, 1};

    DeviceSet devices = DeviceSet::resolve(config);
    EXPECT_EQ(devices.mode(), AffinityMode::Gpu);
    EXPECT_EQ(devices.dummyCount(), 2u);

    EXPECT_EQ(devices.timingBinding().cpuSpec, "6");
    EXPECT_EQ(devices.timingBinding().gpuIndex, 2);

    auto dummies = devices.dummyBindings();
    ASSERT_EQ(dummies.size(), 2u);
    EXPECT_EQ(dummies[0].cpuSpec, "6");
    EXPECT_EQ(dummies[0].gpuIndex, 0);
    EXPECT_EQ(dummies[1].cpuSpec, "6");
    EXPECT_EQ(dummies[1].gpuIndex, 1);
}

TEST(DeviceSetTest, SingleDeviceHasNoDummies) {
    Config config;
    config.cpuAffinityList = {"0-3"};
    DeviceSet devices = DeviceSet::resolve(config);
    EXPECT_EQ(devices.dummyCount(), 0u);
    EXPECT_TRUE(devices.dummyBindings().empty());
    EXPECT_EQ(devices.threadCount(), 4);
}

TEST(DeviceSetTest, RejectsIncoherentAffinityLists) {
    Config uneven;
    uneven.cpuAffinityList = {"0,1", "2"};
    EXPECT_THROW((void)DeviceSet::resolve(uneven), ConfigurationError);

    Config malformed;
    malformed.cpuAffinityList = {"0-"};
    EXPECT_THROW((void)DeviceSet::resolve(malformed), ConfigurationError);

    Config empty;
    EXPECT_THROW((void)DeviceSet::resolve(empty), ConfigurationError);
}

TEST(DeviceSetTest, GpuModeNeedsExactlyOneCpuSet) {
    Config config;
    config.cpuAffinityList = {"0", "1"};
    config.gpuList = {0, 1};
    EXPECT_THROW((void)DeviceSet::resolve(config), ConfigurationError);
}
