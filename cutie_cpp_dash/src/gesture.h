#ifndef CUTIE_GESTURE_H
#define CUTIE_GESTURE_H

#include <optional>

#include "geometry.h"

namespace cutie {

constexpr int kDefaultSwipeThreshold = 50;

enum class GestureKind {
    None,
    Tap,
    SwipeLeft,
    SwipeRight
};

struct Gesture {
    GestureKind kind = GestureKind::None;
    Point pos;
    int dx = 0;
};

// Pairs pointer-down with pointer-up. A swipe needs |dx| strictly greater than
// the threshold; |dx| == threshold is a tap.
class GestureClassifier {
public:
    explicit GestureClassifier(int threshold = kDefaultSwipeThreshold);

    // Replaces any unresolved anchor.
    void on_pointer_down(Point pos);
    Gesture on_pointer_up(Point pos);
    void cancel() { anchor_.reset(); }

    bool pending() const { return anchor_.has_value(); }
    int threshold() const { return threshold_; }

private:
    int threshold_;
    std::optional<Point> anchor_;
};

}  // namespace cutie

#endif  // CUTIE_GESTURE_H
