#ifndef CUTIE_THEME_H
#define CUTIE_THEME_H

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace cutie {

struct Rgb {
    int r;
    int g;
    int b;
};

enum class Ink {
    Background,
    Text,
    Dim,
    Faint,
    Green,
    DarkGreen,
    Red,
    Orange,
    Yellow,
    Cyan,
    Magenta,
    Purple
};

constexpr int kInkCount = 12;

using Palette = std::array<Rgb, kInkCount>;

// Immutable; switching themes means building a new value.
class Theme {
public:
    Theme(std::string name, const Palette& palette);

    const std::string& name() const { return name_; }
    Rgb color(Ink ink) const { return palette_[static_cast<size_t>(ink)]; }

private:
    std::string name_;
    Palette palette_;
};

constexpr const char* kDefaultThemeName = "default";

const std::vector<std::string>& theme_names();
std::optional<Theme> find_theme(const std::string& name);
Theme default_theme();

}  // namespace cutie

#endif  // CUTIE_THEME_H
