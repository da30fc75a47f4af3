#ifndef CUTIE_SCREENS_H
#define CUTIE_SCREENS_H

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "geometry.h"
#include "navigation.h"
#include "pihole_client.h"
#include "settings.h"
#include "surface.h"
#include "system_info.h"
#include "theme.h"

namespace cutie {

constexpr int kHistoryPoints = 48;
constexpr int kSettingsRows = 6;

// Whatever the scheduler currently has cached, handed to every screen once per tick.
struct ScreenFeed {
    const std::optional<Summary>& summary;
    const std::optional<History>& history;
    const std::optional<TopList>& top_blocked;
    const std::optional<TopList>& top_clients;
    const std::optional<SystemMetrics>& metrics;
    const SettingsRecord& settings;
    bool locked;
};

class Screen {
public:
    virtual ~Screen() = default;

    virtual ScreenId id() const = 0;
    virtual void update(const ScreenFeed& feed) = 0;
    virtual void draw(Surface& surface, const Theme& theme) const = 0;
};

// Optional capability; query with dynamic_cast.
class TapHandler {
public:
    virtual ~TapHandler() = default;

    virtual std::optional<SettingsAction> handle_tap(Point pos) = 0;
};

enum class SettingsRow {
    Theme,
    Scanlines,
    ShowFps,
    Brightness,
    ApiInterval,
    Timeout
};

Rect settings_lock_area(Size panel);
Rect settings_row_rect(Size panel, int row);

// -1 left arrow, +1 right arrow, 0 neither.
int settings_arrow_step(Size panel, int x);

// Cycles through `options` from the position of `current` (or the first option when absent).
template <typename T>
T cycle_option(const std::vector<T>& options, const T& current, int step) {
    if (options.empty()) {
        return current;
    }
    const int n = static_cast<int>(options.size());
    int idx = 0;
    for (int i = 0; i < n; ++i) {
        if (options[i] == current) {
            idx = i;
            break;
        }
    }
    return options[((idx + step) % n + n) % n];
}

std::optional<SettingsAction> settings_action_for(const SettingsRecord& rec, SettingsRow row, int step);

class StatsScreen : public Screen {
public:
    explicit StatsScreen(Size panel) : panel_(panel) {}

    ScreenId id() const override { return ScreenId::Stats; }
    void update(const ScreenFeed& feed) override;
    void draw(Surface& surface, const Theme& theme) const override;

    double displayed_queries() const { return displayed_queries_; }
    double displayed_blocked() const { return displayed_blocked_; }

private:
    Size panel_;
    Summary summary_;
    bool has_data_ = false;
    double displayed_queries_ = 0.0;
    double displayed_blocked_ = 0.0;
    int animation_offset_ = 0;
    std::string dns_ip_ = "N/A";
};

class HistoryScreen : public Screen {
public:
    explicit HistoryScreen(Size panel) : panel_(panel) {}

    ScreenId id() const override { return ScreenId::History; }
    void update(const ScreenFeed& feed) override;
    void draw(Surface& surface, const Theme& theme) const override;

    const History& points() const { return points_; }

private:
    Size panel_;
    History points_;
};

// Ranked name/count list; backs both top-blocked and top-clients.
class TopListScreen : public Screen {
public:
    TopListScreen(Size panel, ScreenId id, std::string title, Ink accent);

    ScreenId id() const override { return id_; }
    void update(const ScreenFeed& feed) override;
    void draw(Surface& surface, const Theme& theme) const override;

private:
    Size panel_;
    ScreenId id_;
    std::string title_;
    Ink accent_;
    TopList entries_;
};

class SystemScreen : public Screen {
public:
    explicit SystemScreen(Size panel) : panel_(panel) {}

    ScreenId id() const override { return ScreenId::SystemInfo; }
    void update(const ScreenFeed& feed) override;
    void draw(Surface& surface, const Theme& theme) const override;

private:
    Size panel_;
    SystemMetrics metrics_;
};

class SettingsScreen : public Screen, public TapHandler {
public:
    explicit SettingsScreen(Size panel) : panel_(panel) {}

    ScreenId id() const override { return ScreenId::Settings; }
    void update(const ScreenFeed& feed) override;
    void draw(Surface& surface, const Theme& theme) const override;
    std::optional<SettingsAction> handle_tap(Point pos) override;

    int selected_row() const { return selected_row_; }

private:
    Size panel_;
    SettingsRecord record_;
    bool locked_ = true;
    int selected_row_ = 0;
};

// Index order matches ScreenId.
std::vector<std::unique_ptr<Screen>> make_screens(Size panel);

// Overlays drawn on top of the active screen.
void draw_page_indicators(Surface& surface, int current, int count);
void draw_fps(Surface& surface, double fps);

}  // namespace cutie

#endif  // CUTIE_SCREENS_H
