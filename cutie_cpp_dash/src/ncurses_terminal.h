#ifndef CUTIE_NCURSES_TERMINAL_H
#define CUTIE_NCURSES_TERMINAL_H

#include <string>
#include <vector>

#include "input.h"
#include "surface.h"

// ncurses.h defines move() and erase() as macros; only the .cpp includes it.
struct screen;

namespace cutie {

constexpr int kMinTerminalCols = 20;
constexpr int kMinTerminalRows = 8;

short nearest_xterm256(Rgb c);
short nearest_basic_color(Rgb c);

// The console session: rasterizes panel-pixel drawing onto character cells and
// reports mouse/touch and keys back in panel pixels.
class NcursesTerminal : public Surface, public InputSource {
public:
    explicit NcursesTerminal(Size panel);
    ~NcursesTerminal() override;

    NcursesTerminal(const NcursesTerminal&) = delete;
    NcursesTerminal& operator=(const NcursesTerminal&) = delete;

    bool open(std::string* error);
    void close();

    Size size() const override { return panel_; }
    void begin(const Theme& theme) override;
    void text(Point at, const std::string& s, Ink ink, bool bold = false) override;
    void frame(const Rect& r, Ink ink, const std::string& title = "") override;
    void fill_rect(const Rect& r, Ink ink) override;
    void scanlines() override;
    void present() override;

    std::vector<InputEvent> poll() override;

private:
    int to_col(int x) const;
    int to_row(int y) const;
    Point to_panel(int col, int row) const;
    void apply_palette(const Theme& theme);
    short text_pair(Ink ink) const { return static_cast<short>(1 + static_cast<int>(ink)); }
    short fill_pair(Ink ink) const { return static_cast<short>(1 + kInkCount + static_cast<int>(ink)); }

    Size panel_;
    ::screen* screen_ = nullptr;
    int rows_ = 0;
    int cols_ = 0;
    bool colors_ = false;
    std::string applied_theme_;
};

}  // namespace cutie

#endif  // CUTIE_NCURSES_TERMINAL_H
