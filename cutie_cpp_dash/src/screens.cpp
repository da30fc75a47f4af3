#include "screens.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <utility>

#include "util.h"

namespace cutie {

namespace {

// Nominal console glyph width in panel pixels, used to centre and clip text.
constexpr int kGlyphWidth = 8;

int frac(int total, double f) {
    return static_cast<int>(static_cast<double>(total) * f);
}

int text_width(const std::string& s) {
    return static_cast<int>(s.size()) * kGlyphWidth;
}

int max_chars(int width_px) {
    return std::max(0, width_px / kGlyphWidth);
}

void draw_title(Surface& s, Size panel, const std::string& title, Ink ink) {
    s.text({frac(panel.w, 0.02), frac(panel.h, 0.02)}, title, ink, true);
}

void draw_centered(Surface& s, Size panel, int y, const std::string& text, Ink ink, bool bold = false) {
    s.text({std::max(0, (panel.w - text_width(text)) / 2), y}, text, ink, bold);
}

void draw_no_data(Surface& s, Size panel, const std::string& text) {
    draw_centered(s, panel, panel.h / 2, text, Ink::Dim);
}

void draw_bar(Surface& s, const Rect& r, double percent, Ink ink) {
    s.fill_rect(r, Ink::Faint);
    const double p = std::clamp(percent, 0.0, 100.0);
    const int filled = static_cast<int>(std::lround(static_cast<double>(r.w) * p / 100.0));
    if (filled > 0) {
        s.fill_rect({r.x, r.y, filled, r.h}, ink);
    }
}

void draw_stat_box(Surface& s, const Rect& r, const std::string& label, const std::string& value, Ink ink,
                   int pad) {
    s.frame(r, ink);
    s.text({r.x + pad, r.y + r.h / 4}, label, ink);
    s.text({r.x + pad, r.y + r.h * 5 / 8}, value, Ink::Text, true);
}

const std::vector<int>& api_interval_options() {
    static const std::vector<int> v(kApiIntervalOptions.begin(), kApiIntervalOptions.end());
    return v;
}

const std::vector<int>& timeout_options() {
    static const std::vector<int> v(kTimeoutOptions.begin(), kTimeoutOptions.end());
    return v;
}

std::string timeout_label(int minutes) {
    return minutes == 0 ? "NEVER" : std::to_string(minutes) + "M";
}

Ink temperature_ink(double c) {
    if (c >= 70.0) return Ink::Red;
    if (c >= 60.0) return Ink::Yellow;
    return Ink::Green;
}

}  // namespace

Rect settings_lock_area(Size panel) {
    const int w = std::max(40, frac(panel.w, 0.12));
    const int h = std::max(32, frac(panel.h, 0.12));
    return {panel.w - w, 0, w, h};
}

Rect settings_row_rect(Size panel, int row) {
    const int top = frac(panel.h, 0.15);
    const int row_h = frac(panel.h, 0.11);
    const int gap = frac(panel.h, 0.015);
    return {frac(panel.w, 0.02), top + row * (row_h + gap), frac(panel.w, 0.96), row_h};
}

int settings_arrow_step(Size panel, int x) {
    if (x >= frac(panel.w, 0.42) && x < frac(panel.w, 0.58)) {
        return -1;
    }
    if (x >= frac(panel.w, 0.84)) {
        return 1;
    }
    return 0;
}

std::optional<SettingsAction> settings_action_for(const SettingsRecord& rec, SettingsRow row, int step) {
    switch (row) {
        case SettingsRow::Theme:
            if (step == 0) return std::nullopt;
            return ChangeTheme{cycle_option(theme_names(), rec.theme, step)};
        case SettingsRow::Scanlines:
            return ToggleScanlines{!rec.scanlines};
        case SettingsRow::ShowFps:
            return ToggleFps{!rec.show_fps};
        case SettingsRow::Brightness:
            if (step == 0) return std::nullopt;
            return SetBrightness{clamp_brightness(rec.brightness + step * kBrightnessStep)};
        case SettingsRow::ApiInterval:
            if (step == 0) return std::nullopt;
            return SetApiInterval{cycle_option(api_interval_options(), rec.api_interval, step)};
        case SettingsRow::Timeout:
            if (step == 0) return std::nullopt;
            return SetTimeout{cycle_option(timeout_options(), rec.screen_timeout, step)};
    }
    return std::nullopt;
}

void StatsScreen::update(const ScreenFeed& feed) {
    if (feed.summary) {
        summary_ = *feed.summary;
        has_data_ = true;
    }
    if (feed.metrics) {
        dns_ip_ = feed.metrics->ip_address;
    }
    displayed_queries_ += (static_cast<double>(summary_.total_queries) - displayed_queries_) * 0.1;
    displayed_blocked_ += (static_cast<double>(summary_.blocked) - displayed_blocked_) * 0.1;
    animation_offset_ = (animation_offset_ + 1) % 360;
}

void StatsScreen::draw(Surface& s, const Theme&) const {
    const int W = panel_.w;
    const int H = panel_.h;
    const int margin = frac(W, 0.02);
    const int pad = frac(W, 0.03);
    const int box_w = (W - 3 * margin) / 2;
    const int right_x = 2 * margin + box_w;

    draw_title(s, panel_, "PI-HOLE", Ink::Green);
    if (!has_data_) {
        s.text({W - text_width("CONNECTING") - margin, frac(H, 0.02)}, "CONNECTING", Ink::Dim);
    }

    const int row1_y = frac(H, 0.125);
    const int row1_h = frac(H, 0.20);
    draw_stat_box(s, {margin, row1_y, box_w, row1_h}, "QUERIES",
                  std::to_string(std::llround(displayed_queries_)), Ink::Green, pad);
    draw_stat_box(s, {right_x, row1_y, box_w, row1_h}, "BLOCKED",
                  std::to_string(std::llround(displayed_blocked_)), Ink::Red, pad);

    const int row2_y = frac(H, 0.375);
    const int bar_w = frac(W, 0.77);
    s.text({margin, row2_y}, "BLOCK RATE", Ink::Cyan);
    draw_bar(s, {margin, row2_y + frac(H, 0.07), bar_w, frac(H, 0.078)}, summary_.percent_blocked, Ink::Cyan);
    s.text({margin + bar_w + margin, row2_y + frac(H, 0.07)}, format_double(summary_.percent_blocked, 1) + "%",
           Ink::Text, true);

    const int row3_y = frac(H, 0.547);
    const int row3_h = frac(H, 0.172);
    draw_stat_box(s, {margin, row3_y, box_w, row3_h}, "CLIENTS", std::to_string(summary_.active_clients),
                  Ink::Yellow, pad);
    draw_stat_box(s, {right_x, row3_y, box_w, row3_h}, "BLOCKLIST", format_count(summary_.domains_blocked),
                  Ink::Purple, pad);

    const int row4_y = frac(H, 0.766);
    const int row4_h = frac(H, 0.156);
    const Ink status_ink = summary_.enabled ? Ink::Green : Ink::Red;
    const Rect status_box{margin, row4_y, box_w, row4_h};
    s.frame(status_box, status_ink);
    s.text({status_box.x + pad, status_box.y + row4_h / 4}, "STATUS", status_ink);
    const int pulse = static_cast<int>(std::abs(std::sin(animation_offset_ * 0.1)) * 3.0);
    const int dot = std::max(6, frac(H, 0.025)) + pulse;
    s.fill_rect({status_box.x + pad, status_box.y + row4_h * 5 / 8, dot, dot}, status_ink);
    s.text({status_box.x + pad + dot + margin, status_box.y + row4_h * 5 / 8},
           summary_.enabled ? "ENABLED" : "DISABLED", Ink::Text, true);
    draw_stat_box(s, {right_x, row4_y, box_w, row4_h}, "DNS", dns_ip_, Ink::Cyan, pad);
}

void HistoryScreen::update(const ScreenFeed& feed) {
    if (!feed.history) {
        return;
    }
    const History& all = *feed.history;
    const size_t start = all.size() > static_cast<size_t>(kHistoryPoints) ? all.size() - kHistoryPoints : 0;
    points_.assign(all.begin() + static_cast<std::ptrdiff_t>(start), all.end());
}

void HistoryScreen::draw(Surface& s, const Theme&) const {
    draw_title(s, panel_, "QUERY HISTORY", Ink::Green);
    if (points_.empty()) {
        draw_no_data(s, panel_, "NO DATA");
        return;
    }

    const Rect graph{frac(panel_.w, 0.04), frac(panel_.h, 0.15), frac(panel_.w, 0.92), frac(panel_.h, 0.68)};
    s.frame(graph, Ink::Faint);

    int peak = 1;
    for (const auto& p : points_) {
        peak = std::max(peak, p.total);
    }
    const int n = static_cast<int>(points_.size());
    const int inner_h = graph.h - 2;
    for (int i = 0; i < n; ++i) {
        const int x0 = graph.x + 1 + (graph.w - 2) * i / n;
        const int x1 = graph.x + 1 + (graph.w - 2) * (i + 1) / n;
        const int bar_w = std::max(1, x1 - x0 - 1);
        const int total_h = inner_h * points_[i].total / peak;
        const int blocked_h = inner_h * points_[i].blocked / peak;
        const int base = graph.y + graph.h - 1;
        if (total_h > 0) {
            s.fill_rect({x0, base - total_h, bar_w, total_h}, Ink::Green);
        }
        if (blocked_h > 0) {
            s.fill_rect({x0, base - blocked_h, bar_w, blocked_h}, Ink::Red);
        }
    }

    const int legend_y = graph.y + graph.h + frac(panel_.h, 0.03);
    s.text({graph.x, legend_y}, "TOTAL", Ink::Green);
    s.text({graph.x + text_width("TOTAL  "), legend_y}, "BLOCKED", Ink::Red);
    const std::string peak_text = "PEAK " + std::to_string(peak);
    s.text({graph.x + graph.w - text_width(peak_text), legend_y}, peak_text, Ink::Dim);
}

TopListScreen::TopListScreen(Size panel, ScreenId id, std::string title, Ink accent)
    : panel_(panel), id_(id), title_(std::move(title)), accent_(accent) {}

void TopListScreen::update(const ScreenFeed& feed) {
    const std::optional<TopList>& source = id_ == ScreenId::TopBlocked ? feed.top_blocked : feed.top_clients;
    if (source) {
        entries_ = *source;
    }
}

void TopListScreen::draw(Surface& s, const Theme&) const {
    draw_title(s, panel_, title_, accent_);
    if (entries_.empty()) {
        draw_no_data(s, panel_, "No data");
        return;
    }

    int peak = 1;
    for (const auto& e : entries_) {
        peak = std::max(peak, e.count);
    }

    const int margin = frac(panel_.w, 0.02);
    const int name_x = margin + text_width("10. ");
    const int count_x = panel_.w - frac(panel_.w, 0.25);
    const int bar_x = panel_.w - frac(panel_.w, 0.15);
    const int bar_max = frac(panel_.w, 0.125);
    const int row_h = frac(panel_.h, 0.0875);
    int y = frac(panel_.h, 0.125);

    const int rows = std::min(static_cast<int>(entries_.size()), kTopListSize);
    for (int i = 0; i < rows; ++i) {
        const TopEntry& e = entries_[i];
        s.text({margin, y}, std::to_string(i + 1) + ".", Ink::Dim);
        s.text({name_x, y}, fit(e.name, max_chars(count_x - name_x - margin)), Ink::Text);
        s.text({count_x, y}, std::to_string(e.count), accent_);
        const int w = std::max(1, bar_max * e.count / peak);
        s.fill_rect({bar_x, y, w, std::max(4, row_h / 2)}, accent_);
        y += row_h;
    }
}

void SystemScreen::update(const ScreenFeed& feed) {
    if (feed.metrics) {
        metrics_ = *feed.metrics;
    }
}

void SystemScreen::draw(Surface& s, const Theme&) const {
    draw_title(s, panel_, "SYSTEM", Ink::Cyan);

    const int margin = frac(panel_.w, 0.02);
    const int label_w = text_width("DISK ");
    const int bar_x = margin + label_w;
    const int bar_w = frac(panel_.w, 0.55);
    const int value_x = bar_x + bar_w + margin;
    const int row_h = frac(panel_.h, 0.10);
    const int bar_h = std::max(4, row_h / 2);
    int y = frac(panel_.h, 0.13);

    s.text({margin, y}, "CPU", Ink::Green);
    draw_bar(s, {bar_x, y, bar_w, bar_h}, metrics_.cpu_percent, Ink::Green);
    s.text({value_x, y}, format_double(metrics_.cpu_percent, 1) + "%", Ink::Text);
    y += row_h;

    s.text({margin, y}, "MEM", Ink::Yellow);
    draw_bar(s, {bar_x, y, bar_w, bar_h}, metrics_.mem_percent(), Ink::Yellow);
    s.text({value_x, y},
           format_double(metrics_.mem_used_mb, 0) + "/" + format_double(metrics_.mem_total_mb, 0) + "MB",
           Ink::Text);
    y += row_h;

    s.text({margin, y}, "DISK", Ink::Purple);
    draw_bar(s, {bar_x, y, bar_w, bar_h}, metrics_.disk_percent(), Ink::Purple);
    s.text({value_x, y},
           format_double(metrics_.disk_used_gb, 1) + "/" + format_double(metrics_.disk_total_gb, 1) + "GB",
           Ink::Text);
    y += row_h;

    const Ink temp_ink = temperature_ink(metrics_.temp_c);
    s.text({margin, y}, "TEMP", temp_ink);
    draw_bar(s, {bar_x, y, bar_w, bar_h}, metrics_.temp_c / 85.0 * 100.0, temp_ink);
    s.text({value_x, y}, format_double(metrics_.temp_c, 1) + "C", Ink::Text);
    y += row_h + row_h / 2;

    const int info_value_x = margin + text_width("UPTIME  ");
    const std::pair<const char*, std::string> info[] = {
        {"UPTIME", metrics_.uptime},
        {"IP", metrics_.ip_address},
        {"HOST", metrics_.hostname},
        {"FAN", metrics_.fan_rpm > 0 ? std::to_string(metrics_.fan_rpm) + " RPM" : std::string("N/A")},
    };
    for (const auto& row : info) {
        s.text({margin, y}, row.first, Ink::Cyan);
        s.text({info_value_x, y}, row.second, Ink::Text);
        y += row_h;
    }
}

void SettingsScreen::update(const ScreenFeed& feed) {
    record_ = feed.settings;
    locked_ = feed.locked;
}

std::optional<SettingsAction> SettingsScreen::handle_tap(Point pos) {
    for (int row = 0; row < kSettingsRows; ++row) {
        if (!settings_row_rect(panel_, row).contains(pos)) {
            continue;
        }
        selected_row_ = row;
        return settings_action_for(record_, static_cast<SettingsRow>(row), settings_arrow_step(panel_, pos.x));
    }
    return std::nullopt;
}

void SettingsScreen::draw(Surface& s, const Theme&) const {
    draw_title(s, panel_, "SETTINGS", Ink::Cyan);

    const Rect lock = settings_lock_area(panel_);
    const Ink lock_ink = locked_ ? Ink::Red : Ink::Green;
    s.frame(lock, lock_ink);
    const std::string lock_text = locked_ ? "LOCK" : "OPEN";
    s.text({lock.x + (lock.w - text_width(lock_text)) / 2, lock.y + lock.h / 3}, lock_text, lock_ink, true);
    const std::string version = std::string("v") + CUTIE_VERSION;
    s.text({panel_.w - text_width(version) - frac(panel_.w, 0.02), lock.y + lock.h + 2}, version, Ink::Dim);

    struct RowView {
        const char* label;
        std::string value;
        bool arrows;
    };
    const RowView rows[kSettingsRows] = {
        {"THEME", to_upper(record_.theme), true},
        {"SCANLINES", record_.scanlines ? "ON" : "OFF", false},
        {"SHOW FPS", record_.show_fps ? "ON" : "OFF", false},
        {"BRIGHTNESS", std::to_string(record_.brightness) + "%", true},
        {"API REFRESH", std::to_string(record_.api_interval) + "S", true},
        {"TIMEOUT", timeout_label(record_.screen_timeout), true},
    };

    const int left_arrow_x = frac(panel_.w, 0.45);
    const int right_arrow_x = frac(panel_.w, 0.88);
    const int value_x0 = frac(panel_.w, 0.58);
    const int value_x1 = frac(panel_.w, 0.84);
    for (int i = 0; i < kSettingsRows; ++i) {
        const Rect r = settings_row_rect(panel_, i);
        const bool selected = i == selected_row_;
        const Ink border = selected ? Ink::Green : Ink::Dim;
        const int text_y = r.y + r.h / 3;
        s.frame(r, border);
        s.text({frac(panel_.w, 0.05), text_y}, rows[i].label, border);
        if (rows[i].arrows) {
            const Ink arrow = selected ? Ink::Text : Ink::Dim;
            s.text({left_arrow_x, text_y}, "<", arrow, true);
            s.text({right_arrow_x, text_y}, ">", arrow, true);
        }
        const int value_w = text_width(rows[i].value);
        s.text({value_x0 + std::max(0, (value_x1 - value_x0 - value_w) / 2), text_y}, rows[i].value, Ink::Text,
               true);
    }

    draw_centered(s, panel_, frac(panel_.h, 0.92), locked_ ? "TAP LOCK TO EDIT" : "TAP TO CHANGE", Ink::Dim);
}

std::vector<std::unique_ptr<Screen>> make_screens(Size panel) {
    std::vector<std::unique_ptr<Screen>> screens;
    screens.push_back(std::make_unique<StatsScreen>(panel));
    screens.push_back(std::make_unique<HistoryScreen>(panel));
    screens.push_back(std::make_unique<TopListScreen>(panel, ScreenId::TopBlocked, "TOP BLOCKED", Ink::Red));
    screens.push_back(std::make_unique<TopListScreen>(panel, ScreenId::TopClients, "TOP CLIENTS", Ink::Cyan));
    screens.push_back(std::make_unique<SystemScreen>(panel));
    screens.push_back(std::make_unique<SettingsScreen>(panel));
    return screens;
}

void draw_page_indicators(Surface& s, int current, int count) {
    const Size panel = s.size();
    const int spacing = 16;
    const int dot = 6;
    const int total = spacing * (count - 1) + dot;
    const int x0 = (panel.w - total) / 2;
    const int y = panel.h - dot - 4;
    for (int i = 0; i < count; ++i) {
        s.fill_rect({x0 + i * spacing, y, dot, dot}, i == current ? Ink::Text : Ink::Faint);
    }
}

void draw_fps(Surface& s, double fps) {
    const std::string text = "FPS:" + format_double(fps, 0);
    s.text({(s.size().w - text_width(text)) / 2, 4}, text, Ink::Dim);
}

}  // namespace cutie
