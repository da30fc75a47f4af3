#include "theme.h"

#include <utility>

namespace cutie {

namespace {

struct NamedPalette {
    const char* name;
    Palette palette;
};

// Background, Text, Dim, Faint, Green, DarkGreen, Red, Orange, Yellow, Cyan, Magenta, Purple
const NamedPalette kPalettes[] = {
    {"default", {{{0, 0, 0}, {255, 255, 255}, {100, 100, 100}, {40, 40, 40},
                  {0, 255, 0}, {0, 180, 0}, {255, 50, 50}, {255, 165, 0},
                  {255, 255, 0}, {0, 255, 255}, {255, 0, 255}, {180, 100, 255}}}},
    {"monochrome", {{{0, 0, 0}, {255, 255, 255}, {100, 100, 100}, {40, 40, 40},
                     {255, 255, 255}, {200, 200, 200}, {150, 150, 150}, {180, 180, 180},
                     {220, 220, 220}, {200, 200, 200}, {180, 180, 180}, {160, 160, 160}}}},
    {"neon", {{{0, 0, 0}, {255, 255, 255}, {100, 100, 100}, {40, 40, 40},
               {255, 0, 255}, {200, 0, 200}, {255, 0, 100}, {255, 50, 200},
               {255, 150, 255}, {255, 100, 255}, {255, 0, 255}, {200, 0, 255}}}},
    {"ocean", {{{0, 0, 0}, {0, 150, 255}, {0, 70, 150}, {0, 40, 100},
                {0, 150, 255}, {0, 100, 200}, {0, 70, 150}, {0, 100, 200},
                {0, 150, 255}, {0, 100, 200}, {0, 100, 200}, {0, 70, 150}}}},
    {"sunset", {{{0, 0, 0}, {255, 150, 0}, {150, 70, 0}, {100, 50, 0},
                 {255, 150, 0}, {200, 100, 0}, {150, 70, 0}, {200, 100, 0},
                 {255, 150, 0}, {200, 100, 0}, {200, 100, 0}, {150, 70, 0}}}},
    {"matrix", {{{0, 0, 0}, {0, 200, 0}, {0, 100, 0}, {0, 60, 0},
                 {0, 200, 0}, {0, 150, 0}, {0, 100, 0}, {0, 150, 0},
                 {0, 200, 0}, {0, 150, 0}, {0, 150, 0}, {0, 100, 0}}}},
    {"cyberpunk", {{{0, 0, 0}, {255, 255, 255}, {100, 100, 100}, {40, 40, 40},
                    {0, 255, 150}, {0, 200, 100}, {255, 0, 50}, {255, 150, 0},
                    {255, 255, 0}, {0, 255, 255}, {255, 0, 150}, {150, 0, 255}}}},
    {"666", {{{0, 0, 0}, {200, 0, 0}, {100, 0, 0}, {60, 0, 0},
              {200, 0, 0}, {150, 0, 0}, {100, 0, 0}, {150, 0, 0},
              {200, 0, 0}, {150, 0, 0}, {150, 0, 0}, {100, 0, 0}}}},
};

}  // namespace

Theme::Theme(std::string name, const Palette& palette)
    : name_(std::move(name)), palette_(palette) {}

const std::vector<std::string>& theme_names() {
    static const std::vector<std::string> names = [] {
        std::vector<std::string> out;
        for (const auto& p : kPalettes) {
            out.emplace_back(p.name);
        }
        return out;
    }();
    return names;
}

std::optional<Theme> find_theme(const std::string& name) {
    for (const auto& p : kPalettes) {
        if (name == p.name) {
            return Theme(p.name, p.palette);
        }
    }
    return std::nullopt;
}

Theme default_theme() {
    return Theme(kPalettes[0].name, kPalettes[0].palette);
}

}  // namespace cutie
