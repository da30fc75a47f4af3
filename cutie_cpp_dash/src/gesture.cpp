#include "gesture.h"

#include <algorithm>

namespace cutie {

GestureClassifier::GestureClassifier(int threshold) : threshold_(std::max(1, threshold)) {}

void GestureClassifier::on_pointer_down(Point pos) {
    anchor_ = pos;
}

Gesture GestureClassifier::on_pointer_up(Point pos) {
    Gesture g;
    if (!anchor_) {
        return g;
    }
    g.pos = pos;
    g.dx = pos.x - anchor_->x;
    anchor_.reset();

    if (g.dx < -threshold_) {
        g.kind = GestureKind::SwipeLeft;
    } else if (g.dx > threshold_) {
        g.kind = GestureKind::SwipeRight;
    } else {
        g.kind = GestureKind::Tap;
    }
    return g;
}

}  // namespace cutie
