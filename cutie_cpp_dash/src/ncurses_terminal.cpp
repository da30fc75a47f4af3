#include "ncurses_terminal.h"

#include <algorithm>
#include <clocale>
#include <cmath>
#include <cstdio>

#include "log.h"
#include "util.h"

#include <ncurses.h>

namespace cutie {

short nearest_xterm256(Rgb c) {
    if (c.r == c.g && c.g == c.b) {
        if (c.r < 8) return 16;
        if (c.r > 238) return 231;
        return static_cast<short>(232 + (c.r - 8) / 10);
    }
    auto level = [](int v) { return static_cast<int>(std::lround(clampi(v, 0, 255) / 255.0 * 5.0)); };
    return static_cast<short>(16 + 36 * level(c.r) + 6 * level(c.g) + level(c.b));
}

short nearest_basic_color(Rgb c) {
    const int peak = std::max({c.r, c.g, c.b});
    if (peak < 60) {
        return COLOR_BLACK;
    }
    short out = 0;
    if (c.r * 2 >= peak) out |= COLOR_RED;
    if (c.g * 2 >= peak) out |= COLOR_GREEN;
    if (c.b * 2 >= peak) out |= COLOR_BLUE;
    return out;
}

NcursesTerminal::NcursesTerminal(Size panel) : panel_(panel) {}

NcursesTerminal::~NcursesTerminal() {
    close();
}

bool NcursesTerminal::open(std::string* error) {
    setlocale(LC_ALL, "");
    screen_ = newterm(nullptr, stdout, stdin);
    if (!screen_) {
        if (error) *error = "cannot initialize terminal (TERM unset or unsupported)";
        return false;
    }
    set_term(screen_);
    cbreak();
    noecho();
    keypad(stdscr, TRUE);
    nodelay(stdscr, TRUE);
    curs_set(0);
    set_escdelay(25);
    mousemask(BUTTON1_PRESSED | BUTTON1_RELEASED | BUTTON1_CLICKED, nullptr);
    mouseinterval(0);

    if (has_colors()) {
        start_color();
        colors_ = true;
    }

    getmaxyx(stdscr, rows_, cols_);
    if (rows_ < kMinTerminalRows || cols_ < kMinTerminalCols) {
        if (error) {
            *error = "terminal too small: " + std::to_string(cols_) + "x" + std::to_string(rows_) +
                     ", need " + std::to_string(kMinTerminalCols) + "x" + std::to_string(kMinTerminalRows);
        }
        close();
        return false;
    }
    spdlog::info("terminal {}x{} cells, {} colors, panel {}x{} px", cols_, rows_, colors_ ? COLORS : 0,
                 panel_.w, panel_.h);
    return true;
}

void NcursesTerminal::close() {
    if (!screen_) {
        return;
    }
    endwin();
    delscreen(screen_);
    screen_ = nullptr;
    applied_theme_.clear();
}

int NcursesTerminal::to_col(int x) const {
    return static_cast<int>(static_cast<long long>(x) * cols_ / std::max(1, panel_.w));
}

int NcursesTerminal::to_row(int y) const {
    return static_cast<int>(static_cast<long long>(y) * rows_ / std::max(1, panel_.h));
}

Point NcursesTerminal::to_panel(int col, int row) const {
    // Centre of the cell.
    Point p;
    p.x = static_cast<int>((static_cast<long long>(col) * 2 + 1) * panel_.w / (2LL * std::max(1, cols_)));
    p.y = static_cast<int>((static_cast<long long>(row) * 2 + 1) * panel_.h / (2LL * std::max(1, rows_)));
    return p;
}

void NcursesTerminal::apply_palette(const Theme& theme) {
    if (!colors_) {
        return;
    }
    auto map_color = [](Rgb c) { return COLORS >= 256 ? nearest_xterm256(c) : nearest_basic_color(c); };
    const short bg = map_color(theme.color(Ink::Background));
    for (int i = 0; i < kInkCount; ++i) {
        const Ink ink = static_cast<Ink>(i);
        const short fg = map_color(theme.color(ink));
        init_pair(text_pair(ink), fg, bg);
        init_pair(fill_pair(ink), fg, fg);
    }
    applied_theme_ = theme.name();
    spdlog::debug("palette applied for theme {}", theme.name());
}

void NcursesTerminal::begin(const Theme& theme) {
    if (!screen_) {
        return;
    }
    if (theme.name() != applied_theme_) {
        apply_palette(theme);
    }
    getmaxyx(stdscr, rows_, cols_);
    bkgdset(' ' | COLOR_PAIR(text_pair(Ink::Text)));
    erase();
}

void NcursesTerminal::text(Point at, const std::string& s, Ink ink, bool bold) {
    const int row = to_row(at.y);
    const int col = to_col(at.x);
    if (row < 0 || row >= rows_ || col < 0 || col >= cols_ || s.empty()) {
        return;
    }
    attr_t attr = COLOR_PAIR(text_pair(ink));
    if (bold) {
        attr |= A_BOLD;
    }
    attron(attr);
    mvaddnstr(row, col, s.c_str(), cols_ - col);
    attroff(attr);
}

void NcursesTerminal::frame(const Rect& r, Ink ink, const std::string& title) {
    const int y = to_row(r.y);
    const int x = to_col(r.x);
    const int h = std::min(to_row(r.y + r.h) - y, rows_ - y);
    const int w = std::min(to_col(r.x + r.w) - x, cols_ - x);
    if (h < 2 || w < 4) {
        return;
    }
    attron(COLOR_PAIR(text_pair(ink)));
    mvhline(y, x + 1, ACS_HLINE, w - 2);
    mvhline(y + h - 1, x + 1, ACS_HLINE, w - 2);
    if (h > 2) {
        mvvline(y + 1, x, ACS_VLINE, h - 2);
        mvvline(y + 1, x + w - 1, ACS_VLINE, h - 2);
    }
    mvaddch(y, x, ACS_ULCORNER);
    mvaddch(y, x + w - 1, ACS_URCORNER);
    mvaddch(y + h - 1, x, ACS_LLCORNER);
    mvaddch(y + h - 1, x + w - 1, ACS_LRCORNER);

    if (!title.empty() && w > 8) {
        const std::string t = " " + title + " ";
        mvaddnstr(y, x + 2, t.c_str(), w - 4);
    }
    attroff(COLOR_PAIR(text_pair(ink)));
}

void NcursesTerminal::fill_rect(const Rect& r, Ink ink) {
    if (r.w <= 0 || r.h <= 0) {
        return;
    }
    const int y0 = std::max(0, to_row(r.y));
    const int x0 = std::max(0, to_col(r.x));
    const int y1 = std::min(rows_, std::max(y0 + 1, to_row(r.y + r.h)));
    const int x1 = std::min(cols_, std::max(x0 + 1, to_col(r.x + r.w)));
    const chtype cell = colors_ ? (' ' | COLOR_PAIR(fill_pair(ink))) : (' ' | A_REVERSE);
    for (int row = y0; row < y1; ++row) {
        mvhline(row, x0, cell, x1 - x0);
    }
}

void NcursesTerminal::scanlines() {
    for (int row = 1; row < rows_; row += 2) {
        for (int col = 0; col < cols_; ++col) {
            const chtype ch = mvinch(row, col);
            mvaddch(row, col, ch | A_DIM);
        }
    }
}

void NcursesTerminal::present() {
    if (screen_) {
        refresh();
    }
}

std::vector<InputEvent> NcursesTerminal::poll() {
    std::vector<InputEvent> events;
    if (!screen_) {
        return events;
    }
    int ch = ERR;
    while ((ch = getch()) != ERR) {
        switch (ch) {
            case KEY_MOUSE: {
                MEVENT event{};
                if (getmouse(&event) != OK) {
                    break;
                }
                const Point pos = to_panel(event.x, event.y);
                if (event.bstate & BUTTON1_PRESSED) {
                    events.push_back(PointerDown{pos});
                }
                if (event.bstate & BUTTON1_RELEASED) {
                    events.push_back(PointerUp{pos});
                }
                if (event.bstate & BUTTON1_CLICKED) {
                    events.push_back(PointerDown{pos});
                    events.push_back(PointerUp{pos});
                }
                break;
            }
            case KEY_LEFT:
                events.push_back(KeyDown{Key::Left, ch});
                break;
            case KEY_RIGHT:
                events.push_back(KeyDown{Key::Right, ch});
                break;
            case 27:
                events.push_back(KeyDown{Key::Escape, ch});
                break;
            case 'q':
            case 'Q':
                events.push_back(KeyDown{Key::Quit, ch});
                break;
            case KEY_RESIZE:
                getmaxyx(stdscr, rows_, cols_);
                break;
            default:
                events.push_back(KeyDown{Key::Other, ch});
                break;
        }
    }
    return events;
}

}  // namespace cutie
