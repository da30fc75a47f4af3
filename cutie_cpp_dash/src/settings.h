#ifndef CUTIE_SETTINGS_H
#define CUTIE_SETTINGS_H

#include <array>
#include <string>
#include <variant>

#include "config.h"

namespace cutie {

constexpr int kMinBrightness = 10;
constexpr int kMaxBrightness = 100;
constexpr int kBrightnessStep = 10;

constexpr std::array<int, 4> kApiIntervalOptions = {5, 10, 30, 60};
constexpr std::array<int, 5> kTimeoutOptions = {0, 1, 5, 10, 30};

constexpr const char* kKeyTheme = "CUTIE_THEME";
constexpr const char* kKeyApiInterval = "CUTIE_API_INTERVAL";
constexpr const char* kKeyScreenTimeout = "CUTIE_SCREEN_TIMEOUT";
constexpr const char* kKeyScanlines = "CUTIE_SCANLINES";
constexpr const char* kKeyShowFps = "CUTIE_SHOW_FPS";
constexpr const char* kKeyBrightness = "CUTIE_BRIGHTNESS";

struct SettingsRecord {
    std::string theme = "default";
    int api_interval = 5;       // seconds
    int screen_timeout = 0;     // minutes, 0 = never
    bool scanlines = true;
    bool show_fps = false;
    int brightness = 100;       // percent
};

bool operator==(const SettingsRecord& a, const SettingsRecord& b);
bool operator!=(const SettingsRecord& a, const SettingsRecord& b);

struct ChangeTheme {
    std::string theme;
};
struct ToggleScanlines {
    bool enabled;
};
struct ToggleFps {
    bool enabled;
};
struct SetBrightness {
    int value;
};
struct SetApiInterval {
    int value;
};
struct SetTimeout {
    int value;
};

using SettingsAction =
    std::variant<ChangeTheme, ToggleScanlines, ToggleFps, SetBrightness, SetApiInterval, SetTimeout>;

const char* action_name(const SettingsAction& action);

int clamp_brightness(int value);

// Nearest allowed option; ties resolve to the smaller one.
template <size_t N>
int snap_to_option(int value, const std::array<int, N>& options) {
    int best = options[0];
    for (int opt : options) {
        const int d_best = best > value ? best - value : value - best;
        const int d_opt = opt > value ? opt - value : value - opt;
        if (d_opt < d_best) {
            best = opt;
        }
    }
    return best;
}

// Defaults, overridden by the settings file, overridden by the environment.
// Invalid values are logged and replaced.
SettingsRecord load_settings(const ConfigSource& source);

class SettingsStore {
public:
    SettingsStore(std::string path, SettingsRecord initial);

    const SettingsRecord& current() const { return record_; }
    const std::string& path() const { return path_; }
    const std::string& last_error() const { return last_error_; }

    // Mutates exactly one field. Returns false when the action leaves the record unchanged.
    bool apply(const SettingsAction& action);

    // Merge-on-write: keys this store does not manage are carried over untouched.
    bool persist();

private:
    std::string path_;
    SettingsRecord record_;
    std::string last_error_;
};

}  // namespace cutie

#endif  // CUTIE_SETTINGS_H
