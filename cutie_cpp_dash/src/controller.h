#ifndef CUTIE_CONTROLLER_H
#define CUTIE_CONTROLLER_H

#include <chrono>
#include <functional>
#include <memory>
#include <vector>

#include "gesture.h"
#include "input.h"
#include "navigation.h"
#include "pihole_client.h"
#include "power.h"
#include "scheduler.h"
#include "screens.h"
#include "settings.h"
#include "surface.h"
#include "system_info.h"
#include "theme.h"

namespace cutie {

struct ControllerOptions {
    int swipe_threshold = kDefaultSwipeThreshold;
    int system_interval_sec = 2;
};

using MetricsSource = std::function<SystemMetrics()>;
// Applies a brightness percent to the panel. Returns false when no device took it.
using BrightnessSink = std::function<bool(int percent)>;

// Owns navigation, gestures, refresh schedules, idle tracking and rendering.
// One call to tick() is one loop iteration.
class DashboardController {
public:
    DashboardController(const ControllerOptions& options, SettingsStore& settings, StatsClient& client,
                        MetricsSource metrics, PowerManager& power, Surface& surface, BrightnessSink brightness,
                        TimePoint start);

    DashboardController(const DashboardController&) = delete;
    DashboardController& operator=(const DashboardController&) = delete;

    // Returns false once a quit was requested.
    bool tick(TimePoint now, const std::vector<InputEvent>& events);

    bool running() const { return running_; }
    bool asleep() const { return power_.asleep(); }
    const Navigator& navigator() const { return navigator_; }
    const Theme& theme() const { return theme_; }
    const SettingsRecord& settings() const { return settings_.current(); }
    long long frames_rendered() const { return frames_rendered_; }
    // Relocks whose settings write failed; the changes stay in memory.
    int failed_saves() const { return failed_saves_; }
    double fps() const { return fps_; }

private:
    void handle_event(TimePoint now, const InputEvent& event);
    void handle_gesture(const Gesture& gesture);
    void handle_tap(Point pos);
    void apply_settings_action(const SettingsAction& action);
    void check_idle(TimePoint now);
    void update_screens();
    void update_screen(Screen& screen);
    void render();
    void track_fps(TimePoint now);

    SettingsStore& settings_;
    PowerManager& power_;
    Surface& surface_;
    BrightnessSink brightness_;

    Navigator navigator_;
    GestureClassifier gestures_;
    RefreshScheduler scheduler_;
    RefreshSlot<Summary>* summary_ = nullptr;
    RefreshSlot<History>* history_ = nullptr;
    RefreshSlot<TopList>* top_blocked_ = nullptr;
    RefreshSlot<TopList>* top_clients_ = nullptr;
    RefreshSlot<SystemMetrics>* metrics_ = nullptr;
    std::vector<std::unique_ptr<Screen>> screens_;
    Theme theme_;

    TimePoint last_activity_;
    bool running_ = true;
    long long frames_rendered_ = 0;
    int failed_saves_ = 0;
    TimePoint fps_window_start_;
    int fps_window_frames_ = 0;
    double fps_ = 0.0;
};

}  // namespace cutie

#endif  // CUTIE_CONTROLLER_H
