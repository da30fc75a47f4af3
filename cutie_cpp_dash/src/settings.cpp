#include "settings.h"

#include <unistd.h>

#include <utility>

#include "log.h"
#include "theme.h"
#include "util.h"

namespace cutie {

namespace {

template <size_t N>
int read_option(const ConfigSource& source, const char* key, int fallback, const std::array<int, N>& options) {
    const std::optional<std::string> raw = source.get(key);
    if (!raw) {
        return fallback;
    }
    const std::optional<int> parsed = parse_int(*raw);
    if (!parsed) {
        spdlog::warn("{}='{}' is not a number, using {}", key, *raw, fallback);
        return fallback;
    }
    const int snapped = snap_to_option(*parsed, options);
    if (snapped != *parsed) {
        spdlog::warn("{}={} is not an allowed value, using {}", key, *parsed, snapped);
    }
    return snapped;
}

}  // namespace

bool operator==(const SettingsRecord& a, const SettingsRecord& b) {
    return a.theme == b.theme && a.api_interval == b.api_interval && a.screen_timeout == b.screen_timeout &&
           a.scanlines == b.scanlines && a.show_fps == b.show_fps && a.brightness == b.brightness;
}

bool operator!=(const SettingsRecord& a, const SettingsRecord& b) {
    return !(a == b);
}

const char* action_name(const SettingsAction& action) {
    return std::visit(overloaded{
        [](const ChangeTheme&) { return "change_theme"; },
        [](const ToggleScanlines&) { return "toggle_scanlines"; },
        [](const ToggleFps&) { return "toggle_fps"; },
        [](const SetBrightness&) { return "set_brightness"; },
        [](const SetApiInterval&) { return "set_api_interval"; },
        [](const SetTimeout&) { return "set_timeout"; },
    }, action);
}

int clamp_brightness(int value) {
    return clampi(value, kMinBrightness, kMaxBrightness);
}

SettingsRecord load_settings(const ConfigSource& source) {
    SettingsRecord rec;

    const std::string theme = source.get_string(kKeyTheme, rec.theme);
    if (find_theme(theme)) {
        rec.theme = theme;
    } else {
        spdlog::warn("unknown theme '{}', using {}", theme, rec.theme);
    }

    rec.api_interval = read_option(source, kKeyApiInterval, rec.api_interval, kApiIntervalOptions);
    rec.screen_timeout = read_option(source, kKeyScreenTimeout, rec.screen_timeout, kTimeoutOptions);
    rec.scanlines = source.get_bool(kKeyScanlines, rec.scanlines);
    rec.show_fps = source.get_bool(kKeyShowFps, rec.show_fps);
    rec.brightness = source.get_int(kKeyBrightness, rec.brightness, kMinBrightness, kMaxBrightness);
    return rec;
}

SettingsStore::SettingsStore(std::string path, SettingsRecord initial)
    : path_(std::move(path)), record_(std::move(initial)) {}

bool SettingsStore::apply(const SettingsAction& action) {
    const SettingsRecord before = record_;
    std::visit(overloaded{
        [&](const ChangeTheme& a) {
            if (!find_theme(a.theme)) {
                spdlog::warn("ignoring unknown theme '{}'", a.theme);
                return;
            }
            record_.theme = a.theme;
        },
        [&](const ToggleScanlines& a) { record_.scanlines = a.enabled; },
        [&](const ToggleFps& a) { record_.show_fps = a.enabled; },
        [&](const SetBrightness& a) { record_.brightness = clamp_brightness(a.value); },
        [&](const SetApiInterval& a) { record_.api_interval = snap_to_option(a.value, kApiIntervalOptions); },
        [&](const SetTimeout& a) { record_.screen_timeout = snap_to_option(a.value, kTimeoutOptions); },
    }, action);

    const bool changed = record_ != before;
    if (changed) {
        spdlog::debug("settings: {} applied", action_name(action));
    }
    return changed;
}

bool SettingsStore::persist() {
    KeyValueMap values;
    const std::optional<KeyValueMap> existing = load_key_value_file(path_);
    if (existing) {
        values = *existing;
    } else if (::access(path_.c_str(), F_OK) == 0) {
        // Rewriting an unreadable file would drop whatever it holds.
        last_error_ = "cannot read " + path_;
        spdlog::warn("settings not saved: {}", last_error_);
        return false;
    }

    values[kKeyTheme] = record_.theme;
    values[kKeyApiInterval] = std::to_string(record_.api_interval);
    values[kKeyScreenTimeout] = std::to_string(record_.screen_timeout);
    values[kKeyScanlines] = record_.scanlines ? "true" : "false";
    values[kKeyShowFps] = record_.show_fps ? "true" : "false";
    values[kKeyBrightness] = std::to_string(record_.brightness);

    std::string error;
    if (!store_key_value_file(path_, values, &error)) {
        last_error_ = error;
        spdlog::warn("settings not saved: {}", error);
        return false;
    }
    last_error_.clear();
    spdlog::info("settings saved to {}", path_);
    return true;
}

}  // namespace cutie
