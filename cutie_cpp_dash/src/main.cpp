#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "config.h"
#include "controller.h"
#include "log.h"
#include "ncurses_terminal.h"
#include "pihole_client.h"
#include "power.h"
#include "settings.h"
#include "system_info.h"

namespace {

std::atomic<bool> g_quit{false};

void on_signal(int) {
    g_quit = true;
}

}  // namespace

int main() {
    using namespace cutie;

    const EnvLookup env = process_env();
    const std::string config_path = config_file_path(env);
    const std::optional<KeyValueMap> file_values = load_key_value_file(config_path);
    const ConfigSource source(env, file_values.value_or(KeyValueMap{}));

    const RuntimeConfig cfg = load_runtime_config(source, config_path);
    bool level_known = true;
    init_logging(cfg.log_path, parse_log_level(cfg.log_level, &level_known));
    spdlog::info("cutie-dash {} starting", CUTIE_VERSION);
    if (!level_known) {
        spdlog::warn("unknown log level '{}', using info", cfg.log_level);
    }
    if (!file_values) {
        spdlog::info("no settings file at {}, using defaults", cfg.config_path);
    }

    SettingsStore settings(cfg.config_path, load_settings(source));
    PiholeClient client(cfg.api_url, cfg.api_password);
    SystemInfo system_info(cfg.sysfs_root);
    PowerManager power(default_power_strategies(cfg.sysfs_root, run_shell));

    const std::string sysfs_root = cfg.sysfs_root;
    BrightnessSink brightness = [sysfs_root](int percent) { return apply_backlight_percent(sysfs_root, percent); };
    if (settings.current().brightness != kMaxBrightness) {
        brightness(settings.current().brightness);
    }

    NcursesTerminal terminal(Size{cfg.screen_width, cfg.screen_height});
    std::string error;
    if (!terminal.open(&error)) {
        spdlog::error("display init failed: {}", error);
        std::fprintf(stderr, "cutie-dash: %s\n", error.c_str());
        return EXIT_FAILURE;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    ControllerOptions options;
    options.swipe_threshold = cfg.swipe_threshold;
    options.system_interval_sec = cfg.system_interval_sec;

    const auto frame = std::chrono::microseconds(1000000 / cfg.fps);
    auto next_frame = Clock::now();
    DashboardController controller(options, settings, client, [&system_info] { return system_info.sample(); },
                                   power, terminal, brightness, next_frame);

    bool running = true;
    while (running) {
        std::vector<InputEvent> events = terminal.poll();
        if (g_quit) {
            events.push_back(QuitRequested{});
        }
        running = controller.tick(Clock::now(), events);

        next_frame += frame;
        const auto now = Clock::now();
        if (next_frame < now) {
            // Fell behind (slow fetch); don't try to catch up.
            next_frame = now;
        }
        std::this_thread::sleep_until(next_frame);
    }

    if (power.asleep()) {
        power.wake();
    }
    terminal.close();
    spdlog::info("cutie-dash stopped");
    return EXIT_SUCCESS;
}
