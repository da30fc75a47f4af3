#include <gtest/gtest.h>

#include "gesture.h"

namespace cutie {
namespace {

Gesture drag(GestureClassifier& g, int dx) {
    g.on_pointer_down({200, 100});
    return g.on_pointer_up({200 + dx, 110});
}

TEST(GestureClassifier, LeftBeyondThresholdIsSwipeLeft) {
    GestureClassifier g(50);
    const Gesture out = drag(g, -51);
    EXPECT_EQ(out.kind, GestureKind::SwipeLeft);
    EXPECT_EQ(out.dx, -51);
}

TEST(GestureClassifier, RightBeyondThresholdIsSwipeRight) {
    GestureClassifier g(50);
    EXPECT_EQ(drag(g, 51).kind, GestureKind::SwipeRight);
}

TEST(GestureClassifier, ShortMoveIsTap) {
    GestureClassifier g(50);
    const Gesture out = drag(g, 49);
    EXPECT_EQ(out.kind, GestureKind::Tap);
    EXPECT_EQ(out.pos.x, 249);
    EXPECT_EQ(out.pos.y, 110);
}

TEST(GestureClassifier, ExactlyThresholdIsTapInBothDirections) {
    GestureClassifier g(50);
    EXPECT_EQ(drag(g, 50).kind, GestureKind::Tap);
    EXPECT_EQ(drag(g, -50).kind, GestureKind::Tap);
}

TEST(GestureClassifier, PointerUpWithoutAnchorIsNone) {
    GestureClassifier g;
    EXPECT_FALSE(g.pending());
    EXPECT_EQ(g.on_pointer_up({10, 10}).kind, GestureKind::None);
}

TEST(GestureClassifier, AnchorIsConsumedOnce) {
    GestureClassifier g;
    g.on_pointer_down({0, 0});
    EXPECT_EQ(g.on_pointer_up({-100, 0}).kind, GestureKind::SwipeLeft);
    EXPECT_EQ(g.on_pointer_up({-200, 0}).kind, GestureKind::None);
}

TEST(GestureClassifier, SecondPointerDownReplacesAnchor) {
    GestureClassifier g(50);
    g.on_pointer_down({0, 0});
    g.on_pointer_down({300, 0});
    EXPECT_EQ(g.on_pointer_up({310, 0}).kind, GestureKind::Tap);
}

TEST(GestureClassifier, CancelDropsAnchor) {
    GestureClassifier g;
    g.on_pointer_down({0, 0});
    ASSERT_TRUE(g.pending());
    g.cancel();
    EXPECT_EQ(g.on_pointer_up({200, 0}).kind, GestureKind::None);
}

TEST(GestureClassifier, ThresholdIsAtLeastOne) {
    GestureClassifier g(0);
    EXPECT_EQ(g.threshold(), 1);
    EXPECT_EQ(drag(g, 1).kind, GestureKind::Tap);
    EXPECT_EQ(drag(g, 2).kind, GestureKind::SwipeRight);
}

}  // namespace
}  // namespace cutie
