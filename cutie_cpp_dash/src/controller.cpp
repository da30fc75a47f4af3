#include "controller.h"

#include <algorithm>
#include <utility>
#include <variant>

#include "log.h"
#include "util.h"

namespace cutie {

namespace {

Theme theme_or_default(const std::string& name) {
    std::optional<Theme> t = find_theme(name);
    return t ? *t : default_theme();
}

}  // namespace

DashboardController::DashboardController(const ControllerOptions& options, SettingsStore& settings,
                                         StatsClient& client, MetricsSource metrics, PowerManager& power,
                                         Surface& surface, BrightnessSink brightness, TimePoint start)
    : settings_(settings),
      power_(power),
      surface_(surface),
      brightness_(std::move(brightness)),
      gestures_(options.swipe_threshold),
      screens_(make_screens(surface.size())),
      theme_(theme_or_default(settings.current().theme)),
      last_activity_(start),
      fps_window_start_(start) {
    const auto api = std::chrono::seconds(settings_.current().api_interval);
    StatsClient* c = &client;
    summary_ = &scheduler_.add<Summary>("summary", api, [c] { return c->get_summary(); });
    history_ = &scheduler_.add<History>("history", api, [c] { return c->get_history(); });
    top_blocked_ = &scheduler_.add<TopList>("top_blocked", api, [c] { return c->get_top_blocked(kTopListSize); });
    top_clients_ = &scheduler_.add<TopList>("top_clients", api, [c] { return c->get_top_clients(kTopListSize); });
    metrics_ = &scheduler_.add<SystemMetrics>("system", std::chrono::seconds(std::max(1, options.system_interval_sec)),
                                              std::move(metrics));
}

bool DashboardController::tick(TimePoint now, const std::vector<InputEvent>& events) {
    for (const auto& event : events) {
        handle_event(now, event);
        if (!running_) {
            return false;
        }
    }

    if (!power_.asleep()) {
        scheduler_.tick(now);
        update_screens();
    }

    check_idle(now);

    if (!power_.asleep()) {
        render();
        track_fps(now);
    }
    return running_;
}

void DashboardController::handle_event(TimePoint now, const InputEvent& event) {
    if (std::holds_alternative<QuitRequested>(event)) {
        spdlog::info("quit requested");
        running_ = false;
        return;
    }

    last_activity_ = now;

    if (power_.asleep()) {
        // Only a press wakes; the waking event itself does nothing else.
        if (std::holds_alternative<PointerDown>(event) || std::holds_alternative<KeyDown>(event)) {
            power_.wake();
            gestures_.cancel();
        }
        return;
    }

    std::visit(overloaded{
        [this](const PointerDown& e) { gestures_.on_pointer_down(e.pos); },
        [this](const PointerUp& e) { handle_gesture(gestures_.on_pointer_up(e.pos)); },
        [this](const KeyDown& e) {
            switch (e.key) {
                case Key::Left:
                    navigator_.previous();
                    break;
                case Key::Right:
                    navigator_.next();
                    break;
                case Key::Escape:
                case Key::Quit:
                    spdlog::info("quit key pressed");
                    running_ = false;
                    break;
                case Key::Other:
                    break;
            }
        },
        [](const QuitRequested&) {},
    }, event);
}

void DashboardController::handle_gesture(const Gesture& gesture) {
    switch (gesture.kind) {
        case GestureKind::SwipeLeft:
            navigator_.next();
            spdlog::debug("swipe left (dx {}) -> {}", gesture.dx, screen_name(navigator_.current()));
            break;
        case GestureKind::SwipeRight:
            navigator_.previous();
            spdlog::debug("swipe right (dx {}) -> {}", gesture.dx, screen_name(navigator_.current()));
            break;
        case GestureKind::Tap:
            handle_tap(gesture.pos);
            break;
        case GestureKind::None:
            break;
    }
}

void DashboardController::handle_tap(Point pos) {
    const bool on_lock = navigator_.current() == ScreenId::Settings &&
                         settings_lock_area(surface_.size()).contains(pos);
    switch (navigator_.route_tap(on_lock)) {
        case TapRoute::Swallow:
            return;
        case TapRoute::ToggleLock:
            if (navigator_.toggle_lock()) {
                spdlog::info("settings locked, saving");
                if (!settings_.persist()) {
                    ++failed_saves_;
                    spdlog::error("settings kept in memory only: {}", settings_.last_error());
                }
            } else {
                spdlog::info("settings unlocked");
            }
            update_screen(*screens_[navigator_.index()]);
            return;
        case TapRoute::Forward:
            break;
    }

    Screen& screen = *screens_[navigator_.index()];
    auto* handler = dynamic_cast<TapHandler*>(&screen);
    if (!handler) {
        return;
    }
    const std::optional<SettingsAction> action = handler->handle_tap(pos);
    if (action) {
        apply_settings_action(*action);
    }
    update_screen(screen);
}

void DashboardController::apply_settings_action(const SettingsAction& action) {
    if (!settings_.apply(action)) {
        return;
    }
    std::visit(overloaded{
        [this](const ChangeTheme& a) {
            theme_ = theme_or_default(a.theme);
            spdlog::info("theme changed to {}", theme_.name());
        },
        [this](const SetBrightness& a) {
            if (brightness_ && !brightness_(a.value)) {
                spdlog::warn("no backlight accepted brightness {}%", a.value);
            }
        },
        [this](const SetApiInterval& a) {
            const auto interval = std::chrono::seconds(a.value);
            summary_->set_interval(interval);
            history_->set_interval(interval);
            top_blocked_->set_interval(interval);
            top_clients_->set_interval(interval);
        },
        [](const ToggleScanlines&) {},
        [](const ToggleFps&) {},
        [](const SetTimeout&) {},
    }, action);
}

void DashboardController::check_idle(TimePoint now) {
    const int timeout_min = settings_.current().screen_timeout;
    if (timeout_min <= 0 || power_.asleep()) {
        return;
    }
    if (now - last_activity_ > std::chrono::minutes(timeout_min)) {
        spdlog::info("idle for more than {} min", timeout_min);
        power_.sleep();
    }
}

void DashboardController::update_screen(Screen& screen) {
    const ScreenFeed feed{summary_->cached(),     history_->cached(), top_blocked_->cached(),
                          top_clients_->cached(), metrics_->cached(), settings_.current(),
                          navigator_.locked()};
    screen.update(feed);
}

void DashboardController::update_screens() {
    for (auto& screen : screens_) {
        update_screen(*screen);
    }
}

void DashboardController::render() {
    const SettingsRecord& rec = settings_.current();
    surface_.begin(theme_);
    screens_[navigator_.index()]->draw(surface_, theme_);
    draw_page_indicators(surface_, navigator_.index(), kScreenCount);
    if (rec.scanlines) {
        surface_.scanlines();
    }
    if (rec.show_fps) {
        draw_fps(surface_, fps_);
    }
    surface_.present();
    ++frames_rendered_;
}

void DashboardController::track_fps(TimePoint now) {
    ++fps_window_frames_;
    const auto elapsed = std::chrono::duration<double>(now - fps_window_start_).count();
    if (elapsed >= 1.0) {
        fps_ = fps_window_frames_ / elapsed;
        fps_window_frames_ = 0;
        fps_window_start_ = now;
    }
}

}  // namespace cutie
