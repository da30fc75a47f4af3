#ifndef CUTIE_GEOMETRY_H
#define CUTIE_GEOMETRY_H

namespace cutie {

// Panel pixel coordinates, origin top-left.
struct Point {
    int x = 0;
    int y = 0;
};

struct Rect {
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;

    bool contains(Point p) const {
        return p.x >= x && p.x < x + w && p.y >= y && p.y < y + h;
    }
};

struct Size {
    int w = 0;
    int h = 0;
};

}  // namespace cutie

#endif  // CUTIE_GEOMETRY_H
