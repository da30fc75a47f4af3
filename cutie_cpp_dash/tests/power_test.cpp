#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "power.h"
#include "test_support.h"

namespace cutie {
namespace {

using testing_support::TempDir;

constexpr const char* kBlank = "/sys/class/graphics/fb0/blank";
constexpr const char* kRpi = "/sys/class/backlight/rpi_backlight";
constexpr const char* kSoc = "/sys/class/backlight/soc:backlight";

struct FakeXset {
    int exit_code = 1;
    std::vector<std::string> commands;

    CommandRunner runner() {
        return [this](const std::string& cmd) {
            commands.push_back(cmd);
            ShellResult r;
            r.exit_code = exit_code;
            return r;
        };
    }
};

PowerStrategy counting(const std::string& name, bool works, int* sleeps, int* wakes) {
    return {
        name,
        [=] {
            ++*sleeps;
            return SleepOutcome{works, std::nullopt};
        },
        [=](const std::optional<int>&) {
            ++*wakes;
            return true;
        },
    };
}

TEST(WriteSysfsValue, NeverCreatesFiles) {
    TempDir dir;
    EXPECT_FALSE(write_sysfs_value(dir.file("/absent"), "1"));
    dir.write("/present", "123\n");
    EXPECT_TRUE(write_sysfs_value(dir.file("/present"), "0"));
    EXPECT_EQ(dir.read("/present"), "0");
}

TEST(PowerManager, FramebufferBlankIsTriedFirst) {
    TempDir dir;
    dir.write(kBlank, "0");
    dir.write(std::string(kRpi) + "/bl_power", "0");
    FakeXset xset;
    PowerManager pm(default_power_strategies(dir.path(), xset.runner()));

    pm.sleep();
    EXPECT_TRUE(pm.asleep());
    EXPECT_EQ(pm.state().active_strategy, dir.file(kBlank));
    EXPECT_EQ(dir.read(kBlank), "1");
    EXPECT_EQ(dir.read(std::string(kRpi) + "/bl_power"), "0");
    EXPECT_TRUE(xset.commands.empty());

    pm.wake();
    EXPECT_FALSE(pm.asleep());
    EXPECT_EQ(dir.read(kBlank), "0");
    EXPECT_FALSE(pm.state().active_strategy);
}

TEST(PowerManager, BlPowerBeforeBrightness) {
    TempDir dir;
    dir.write(std::string(kSoc) + "/bl_power", "0");
    dir.write(std::string(kRpi) + "/brightness", "200");
    FakeXset xset;
    PowerManager pm(default_power_strategies(dir.path(), xset.runner()));

    pm.sleep();
    EXPECT_EQ(pm.state().active_strategy, dir.file(std::string(kSoc) + "/bl_power"));
    EXPECT_EQ(dir.read(std::string(kRpi) + "/brightness"), "200");
}

TEST(PowerManager, BrightnessStrategySavesAndRestores) {
    TempDir dir;
    const std::string brightness = std::string(kRpi) + "/brightness";
    dir.write(brightness, "180\n");
    FakeXset xset;
    PowerManager pm(default_power_strategies(dir.path(), xset.runner()));

    pm.sleep();
    ASSERT_TRUE(pm.asleep());
    EXPECT_EQ(pm.state().saved_brightness, 180);
    EXPECT_EQ(dir.read(brightness), "0");

    pm.wake();
    EXPECT_EQ(dir.read(brightness), "180");
    EXPECT_FALSE(pm.state().saved_brightness);
}

TEST(PowerManager, FallsBackToDpms) {
    TempDir dir;
    FakeXset xset;
    xset.exit_code = 0;
    PowerManager pm(default_power_strategies(dir.path(), xset.runner()));

    pm.sleep();
    EXPECT_EQ(pm.state().active_strategy, std::string("xset dpms"));
    ASSERT_EQ(xset.commands.size(), 1u);
    EXPECT_NE(xset.commands[0].find("dpms force off"), std::string::npos);

    pm.wake();
    ASSERT_EQ(xset.commands.size(), 2u);
    EXPECT_NE(xset.commands[1].find("dpms force on"), std::string::npos);
}

TEST(PowerManager, NothingWorksStillAsleep) {
    TempDir dir;
    FakeXset xset;
    PowerManager pm(default_power_strategies(dir.path(), xset.runner()));
    pm.sleep();
    EXPECT_TRUE(pm.asleep());
    EXPECT_FALSE(pm.state().active_strategy);
    pm.wake();
    EXPECT_FALSE(pm.asleep());
}

TEST(PowerManager, EmptyStrategyListStillAsleep) {
    PowerManager pm({});
    pm.sleep();
    EXPECT_TRUE(pm.asleep());
}

TEST(PowerManager, SleepTwiceInvokesStrategiesOnce) {
    int sleeps_a = 0, wakes_a = 0, sleeps_b = 0, wakes_b = 0;
    PowerManager pm({counting("a", false, &sleeps_a, &wakes_a), counting("b", true, &sleeps_b, &wakes_b)});

    pm.sleep();
    const PowerState first = pm.state();
    pm.sleep();
    EXPECT_EQ(sleeps_a, 1);
    EXPECT_EQ(sleeps_b, 1);
    EXPECT_TRUE(pm.state().asleep);
    EXPECT_EQ(pm.state().active_strategy, first.active_strategy);

    pm.wake();
    pm.wake();
    EXPECT_EQ(wakes_a, 0);
    EXPECT_EQ(wakes_b, 1);
}

TEST(PowerManager, WakeWithoutSleepIsNoOp) {
    int sleeps = 0, wakes = 0;
    PowerManager pm({counting("a", true, &sleeps, &wakes)});
    pm.wake();
    EXPECT_FALSE(pm.asleep());
    EXPECT_EQ(wakes, 0);
}

TEST(ApplyBacklightPercent, ScalesToMaxBrightness) {
    TempDir dir;
    dir.write(std::string(kSoc) + "/max_brightness", "255\n");
    dir.write(std::string(kSoc) + "/brightness", "255\n");
    EXPECT_TRUE(apply_backlight_percent(dir.path(), 50));
    EXPECT_EQ(dir.read(std::string(kSoc) + "/brightness"), "128");
}

TEST(ApplyBacklightPercent, LowPercentOnCoarseDeviceStaysLit) {
    TempDir dir;
    dir.write(std::string(kSoc) + "/max_brightness", "1\n");
    dir.write(std::string(kSoc) + "/brightness", "1\n");
    EXPECT_TRUE(apply_backlight_percent(dir.path(), 40));
    EXPECT_EQ(dir.read(std::string(kSoc) + "/brightness"), "1");

    EXPECT_TRUE(apply_backlight_percent(dir.path(), 10));
    EXPECT_EQ(dir.read(std::string(kSoc) + "/brightness"), "1");
}

TEST(ApplyBacklightPercent, ZeroPercentWritesZero) {
    TempDir dir;
    dir.write(std::string(kSoc) + "/max_brightness", "1\n");
    dir.write(std::string(kSoc) + "/brightness", "1\n");
    EXPECT_TRUE(apply_backlight_percent(dir.path(), 0));
    EXPECT_EQ(dir.read(std::string(kSoc) + "/brightness"), "0");
}

TEST(ApplyBacklightPercent, NoDeviceFails) {
    TempDir dir;
    EXPECT_FALSE(apply_backlight_percent(dir.path(), 50));
}

}  // namespace
}  // namespace cutie
