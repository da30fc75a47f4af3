#include <gtest/gtest.h>

#include "navigation.h"

namespace cutie {
namespace {

void go_to(Navigator& nav, ScreenId id) {
    while (nav.current() != id) {
        nav.next();
    }
}

TEST(Navigator, StartsOnStatsLocked) {
    Navigator nav;
    EXPECT_EQ(nav.index(), 0);
    EXPECT_EQ(nav.current(), ScreenId::Stats);
    EXPECT_TRUE(nav.locked());
}

TEST(Navigator, NextAndPreviousWrap) {
    Navigator nav;
    nav.previous();
    EXPECT_EQ(nav.current(), ScreenId::Settings);
    nav.next();
    EXPECT_EQ(nav.current(), ScreenId::Stats);
    for (int i = 0; i < kScreenCount; ++i) {
        nav.next();
    }
    EXPECT_EQ(nav.index(), 0);
}

TEST(Navigator, KLeftThenKRightReturnsHome) {
    for (int start = 0; start < kScreenCount; ++start) {
        for (int k = 0; k <= 3 * kScreenCount; ++k) {
            Navigator nav;
            for (int i = 0; i < start; ++i) nav.next();
            for (int i = 0; i < k; ++i) {
                nav.next();
                ASSERT_GE(nav.index(), 0);
                ASSERT_LT(nav.index(), kScreenCount);
            }
            for (int i = 0; i < k; ++i) {
                nav.previous();
                ASSERT_GE(nav.index(), 0);
                ASSERT_LT(nav.index(), kScreenCount);
            }
            EXPECT_EQ(nav.index(), start) << "start " << start << " k " << k;
        }
    }
}

TEST(Navigator, TapsOffSettingsAreForwarded) {
    Navigator nav;
    EXPECT_EQ(nav.route_tap(false), TapRoute::Forward);
    EXPECT_EQ(nav.route_tap(true), TapRoute::Forward);
}

TEST(Navigator, LockedSettingsSwallowTapsOutsideLock) {
    Navigator nav;
    go_to(nav, ScreenId::Settings);
    EXPECT_EQ(nav.route_tap(false), TapRoute::Swallow);
    EXPECT_EQ(nav.route_tap(true), TapRoute::ToggleLock);
}

TEST(Navigator, UnlockedSettingsForwardTaps) {
    Navigator nav;
    go_to(nav, ScreenId::Settings);
    EXPECT_FALSE(nav.toggle_lock());
    EXPECT_FALSE(nav.locked());
    EXPECT_EQ(nav.route_tap(false), TapRoute::Forward);
    EXPECT_EQ(nav.route_tap(true), TapRoute::ToggleLock);
}

TEST(Navigator, RelockReportsSaveTrigger) {
    Navigator nav;
    EXPECT_FALSE(nav.toggle_lock());
    EXPECT_TRUE(nav.toggle_lock());
    EXPECT_TRUE(nav.locked());
}

}  // namespace
}  // namespace cutie
