#include "navigation.h"

namespace cutie {

const char* screen_name(ScreenId id) {
    switch (id) {
        case ScreenId::Stats: return "stats";
        case ScreenId::History: return "history";
        case ScreenId::TopBlocked: return "top-blocked";
        case ScreenId::TopClients: return "top-clients";
        case ScreenId::SystemInfo: return "system";
        case ScreenId::Settings: return "settings";
    }
    return "stats";
}

void Navigator::next() {
    index_ = (index_ + 1) % kScreenCount;
}

void Navigator::previous() {
    index_ = (index_ + kScreenCount - 1) % kScreenCount;
}

TapRoute Navigator::route_tap(bool on_lock_toggle) const {
    if (current() != ScreenId::Settings) {
        return TapRoute::Forward;
    }
    if (on_lock_toggle) {
        return TapRoute::ToggleLock;
    }
    return locked_ ? TapRoute::Swallow : TapRoute::Forward;
}

bool Navigator::toggle_lock() {
    locked_ = !locked_;
    return locked_;
}

}  // namespace cutie
