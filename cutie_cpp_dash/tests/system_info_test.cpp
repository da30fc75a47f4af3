#include <gtest/gtest.h>

#include "system_info.h"
#include "test_support.h"

namespace cutie {
namespace {

using testing_support::TempDir;

ShellResult hostname_output(const std::string&) {
    ShellResult r;
    r.exit_code = 0;
    r.lines = {"192.168.1.40 fd00::1 "};
    return r;
}

TEST(FormatUptime, DaysAppearOnlyWhenNonZero) {
    EXPECT_EQ(format_uptime(0), "0h 0m");
    EXPECT_EQ(format_uptime(3 * 3600 + 25 * 60 + 59), "3h 25m");
    EXPECT_EQ(format_uptime(2 * 86400 + 5 * 3600 + 60), "2d 5h 1m");
    EXPECT_EQ(format_uptime(-1), "N/A");
}

TEST(SystemInfo, ReadsEverySource) {
    TempDir dir;
    dir.write("/proc/stat", "cpu  100 0 100 800 0 0 0 0 0 0\ncpu0 1 2 3 4\n");
    dir.write("/proc/meminfo", "MemTotal:        1024000 kB\nMemFree:  1000 kB\nMemAvailable:     512000 kB\n");
    dir.write("/sys/class/thermal/thermal_zone0/temp", "52375\n");
    dir.write("/proc/uptime", "90061.42 12345.00\n");
    dir.write("/etc/hostname", "pihole\n");
    dir.write("/sys/devices/platform/cooling_fan/hwmon/hwmon3/fan1_input", "2400\n");

    SystemInfo info(dir.path(), hostname_output);
    SystemMetrics m = info.sample();

    EXPECT_DOUBLE_EQ(m.cpu_percent, 0.0);
    EXPECT_DOUBLE_EQ(m.mem_total_mb, 1000.0);
    EXPECT_DOUBLE_EQ(m.mem_used_mb, 500.0);
    EXPECT_DOUBLE_EQ(m.mem_percent(), 50.0);
    EXPECT_DOUBLE_EQ(m.temp_c, 52.375);
    EXPECT_EQ(m.uptime, "1d 1h 1m");
    EXPECT_EQ(m.ip_address, "192.168.1.40");
    EXPECT_EQ(m.hostname, "pihole");
    EXPECT_EQ(m.fan_rpm, 2400);
    EXPECT_GT(m.disk_total_gb, 0.0);

    // 1000 more jiffies, 250 of them idle.
    dir.write("/proc/stat", "cpu  400 0 550 1050 0 0 0 0 0 0\n");
    m = info.sample();
    EXPECT_DOUBLE_EQ(m.cpu_percent, 75.0);
}

TEST(SystemInfo, MissingSourcesDegrade) {
    TempDir dir;
    ShellResult failed;
    failed.exit_code = 1;
    SystemInfo info(dir.path() + "/nothing-here", [failed](const std::string&) { return failed; });
    const SystemMetrics m = info.sample();
    EXPECT_DOUBLE_EQ(m.cpu_percent, 0.0);
    EXPECT_DOUBLE_EQ(m.mem_percent(), 0.0);
    EXPECT_DOUBLE_EQ(m.disk_percent(), 0.0);
    EXPECT_DOUBLE_EQ(m.temp_c, 0.0);
    EXPECT_EQ(m.uptime, "N/A");
    EXPECT_EQ(m.ip_address, "N/A");
    EXPECT_EQ(m.hostname, "unknown");
    EXPECT_EQ(m.fan_rpm, 0);
}

}  // namespace
}  // namespace cutie
