#include "power.h"

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <utility>

#include "log.h"

namespace cutie {

namespace {

const char* kBacklightDevices[] = {
    "/sys/class/backlight/rpi_backlight",
    "/sys/class/backlight/10-0045",
    "/sys/class/backlight/soc:backlight",
    "/sys/class/backlight/backlight",
};

constexpr const char* kFramebufferBlank = "/sys/class/graphics/fb0/blank";

// fb0/blank and bl_power share the encoding: 1 = blanked, 0 = on.
PowerStrategy blank_file_strategy(const std::string& path) {
    return {
        path,
        [path] { return SleepOutcome{write_sysfs_value(path, "1"), std::nullopt}; },
        [path](const std::optional<int>&) { return write_sysfs_value(path, "0"); },
    };
}

PowerStrategy brightness_strategy(const std::string& path) {
    return {
        path,
        [path] {
            SleepOutcome out;
            const std::optional<std::string> text = read_text_file(path);
            if (!text) {
                return out;
            }
            const std::optional<int> current = parse_int(*text);
            if (!current) {
                return out;
            }
            if (!write_sysfs_value(path, "0")) {
                return out;
            }
            out.ok = true;
            out.saved_brightness = *current;
            return out;
        },
        [path](const std::optional<int>& saved) {
            if (!saved) {
                return false;
            }
            return write_sysfs_value(path, std::to_string(*saved));
        },
    };
}

PowerStrategy dpms_strategy(CommandRunner runner) {
    auto xset = [runner](const char* mode) {
        if (!runner) {
            return false;
        }
        const ShellResult r = runner(std::string("DISPLAY=:0 timeout 2 xset dpms force ") + mode + " >/dev/null 2>&1");
        return r.exit_code == 0;
    };
    return {
        "xset dpms",
        [xset] { return SleepOutcome{xset("off"), std::nullopt}; },
        [xset](const std::optional<int>&) { return xset("on"); },
    };
}

}  // namespace

bool write_sysfs_value(const std::string& path, const std::string& value) {
    const int fd = ::open(path.c_str(), O_WRONLY | O_TRUNC);
    if (fd < 0) {
        return false;
    }
    size_t written = 0;
    bool ok = true;
    while (written < value.size()) {
        const ssize_t n = ::write(fd, value.data() + written, value.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            ok = false;
            break;
        }
        written += static_cast<size_t>(n);
    }
    if (::close(fd) != 0) {
        ok = false;
    }
    return ok;
}

std::vector<PowerStrategy> default_power_strategies(const std::string& root, CommandRunner runner) {
    std::vector<PowerStrategy> out;
    out.push_back(blank_file_strategy(root + kFramebufferBlank));
    for (const char* dev : kBacklightDevices) {
        out.push_back(blank_file_strategy(root + dev + "/bl_power"));
    }
    for (const char* dev : kBacklightDevices) {
        out.push_back(brightness_strategy(root + dev + "/brightness"));
    }
    out.push_back(dpms_strategy(std::move(runner)));
    return out;
}

bool apply_backlight_percent(const std::string& root, int percent) {
    for (const char* dev : kBacklightDevices) {
        const std::string base = root + dev;
        const std::optional<std::string> max_text = read_text_file(base + "/max_brightness");
        if (!max_text) {
            continue;
        }
        const std::optional<int> max_value = parse_int(*max_text);
        if (!max_value || *max_value <= 0) {
            continue;
        }
        int actual = static_cast<int>(std::lround(static_cast<double>(percent) / 100.0 * *max_value));
        if (percent > 0) {
            // A non-zero percent never rounds down to off.
            actual = std::max(1, actual);
        }
        if (write_sysfs_value(base + "/brightness", std::to_string(actual))) {
            spdlog::info("brightness set to {}% via {}", percent, base);
            return true;
        }
    }
    spdlog::warn("could not set brightness: no writable backlight found");
    return false;
}

PowerManager::PowerManager(std::vector<PowerStrategy> strategies) : strategies_(std::move(strategies)) {}

void PowerManager::sleep() {
    if (state_.asleep) {
        return;
    }
    state_.saved_brightness.reset();
    state_.active_strategy.reset();
    active_index_.reset();

    for (size_t i = 0; i < strategies_.size(); ++i) {
        const PowerStrategy& strategy = strategies_[i];
        const SleepOutcome outcome = strategy.sleep ? strategy.sleep() : SleepOutcome{};
        if (!outcome.ok) {
            spdlog::debug("display sleep: {} unavailable", strategy.name);
            continue;
        }
        active_index_ = i;
        state_.active_strategy = strategy.name;
        state_.saved_brightness = outcome.saved_brightness;
        break;
    }

    state_.asleep = true;
    if (state_.active_strategy) {
        spdlog::info("display sleeping via {}", *state_.active_strategy);
    } else {
        spdlog::warn("display sleep: no working method found, rendering paused only");
    }
}

void PowerManager::wake() {
    if (!state_.asleep) {
        return;
    }
    if (active_index_) {
        const PowerStrategy& strategy = strategies_[*active_index_];
        if (!strategy.wake || !strategy.wake(state_.saved_brightness)) {
            spdlog::warn("display wake: {} failed", strategy.name);
        }
    }
    state_.asleep = false;
    state_.saved_brightness.reset();
    state_.active_strategy.reset();
    active_index_.reset();
    spdlog::info("display waking");
}

}  // namespace cutie
