#ifndef CUTIE_INPUT_H
#define CUTIE_INPUT_H

#include <variant>
#include <vector>

#include "geometry.h"

namespace cutie {

enum class Key {
    Left,
    Right,
    Escape,
    Quit,
    Other
};

struct PointerDown {
    Point pos;
};

struct PointerUp {
    Point pos;
};

struct KeyDown {
    Key key = Key::Other;
    int code = 0;
};

struct QuitRequested {};

using InputEvent = std::variant<PointerDown, PointerUp, KeyDown, QuitRequested>;

class InputSource {
public:
    virtual ~InputSource() = default;

    // Everything buffered since the last call, oldest first. Never blocks.
    virtual std::vector<InputEvent> poll() = 0;
};

}  // namespace cutie

#endif  // CUTIE_INPUT_H
