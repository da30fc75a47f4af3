#ifndef CUTIE_NAVIGATION_H
#define CUTIE_NAVIGATION_H

namespace cutie {

enum class ScreenId {
    Stats,
    History,
    TopBlocked,
    TopClients,
    SystemInfo,
    Settings
};

constexpr int kScreenCount = 6;

const char* screen_name(ScreenId id);

enum class TapRoute {
    Forward,     // hand the tap to the active screen
    ToggleLock,  // flip the settings lock
    Swallow      // settings are locked, drop it
};

class Navigator {
public:
    int index() const { return index_; }
    ScreenId current() const { return static_cast<ScreenId>(index_); }
    bool locked() const { return locked_; }

    // SwipeLeft / right arrow.
    void next();
    // SwipeRight / left arrow.
    void previous();

    TapRoute route_tap(bool on_lock_toggle) const;

    // Returns true when the toggle went unlocked -> locked, which is the save trigger.
    bool toggle_lock();

private:
    int index_ = 0;
    bool locked_ = true;
};

}  // namespace cutie

#endif  // CUTIE_NAVIGATION_H
