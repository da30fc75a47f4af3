#ifndef CUTIE_POWER_H
#define CUTIE_POWER_H

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "util.h"

namespace cutie {

struct SleepOutcome {
    bool ok = false;
    std::optional<int> saved_brightness;
};

// One way of blanking the panel. `name` is the device path or command it drives.
struct PowerStrategy {
    std::string name;
    std::function<SleepOutcome()> sleep;
    std::function<bool(const std::optional<int>& saved_brightness)> wake;
};

struct PowerState {
    bool asleep = false;
    // Only meaningful while asleep.
    std::optional<int> saved_brightness;
    std::optional<std::string> active_strategy;
};

// Opens an existing file write-only and replaces its contents. Never creates files.
bool write_sysfs_value(const std::string& path, const std::string& value);

// Framebuffer blank, backlight bl_power, backlight brightness, then DPMS, in that order.
std::vector<PowerStrategy> default_power_strategies(const std::string& root, CommandRunner runner);

// Scales percent onto the first backlight that exposes brightness + max_brightness.
bool apply_backlight_percent(const std::string& root, int percent);

class PowerManager {
public:
    explicit PowerManager(std::vector<PowerStrategy> strategies);

    // No-op when already asleep. Marks the display asleep even if no strategy worked.
    void sleep();
    // No-op when awake.
    void wake();

    bool asleep() const { return state_.asleep; }
    const PowerState& state() const { return state_; }

private:
    std::vector<PowerStrategy> strategies_;
    PowerState state_;
    std::optional<size_t> active_index_;
};

}  // namespace cutie

#endif  // CUTIE_POWER_H
