#ifndef CUTIE_SURFACE_H
#define CUTIE_SURFACE_H

#include <string>

#include "geometry.h"
#include "theme.h"

namespace cutie {

// Drawing target in panel pixels. Colors are theme roles resolved against the
// theme handed to begin().
class Surface {
public:
    virtual ~Surface() = default;

    virtual Size size() const = 0;

    virtual void begin(const Theme& theme) = 0;
    virtual void text(Point at, const std::string& s, Ink ink, bool bold = false) = 0;
    virtual void frame(const Rect& r, Ink ink, const std::string& title = "") = 0;
    virtual void fill_rect(const Rect& r, Ink ink) = 0;
    virtual void scanlines() = 0;
    virtual void present() = 0;
};

}  // namespace cutie

#endif  // CUTIE_SURFACE_H
