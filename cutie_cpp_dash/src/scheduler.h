#ifndef CUTIE_SCHEDULER_H
#define CUTIE_SCHEDULER_H

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cutie {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

class RefreshSlotBase {
public:
    explicit RefreshSlotBase(std::string name, Clock::duration interval)
        : name_(std::move(name)), interval_(interval) {}
    virtual ~RefreshSlotBase() = default;

    const std::string& name() const { return name_; }
    Clock::duration interval() const { return interval_; }
    void set_interval(Clock::duration interval) { interval_ = interval; }
    const std::optional<TimePoint>& last_fetch() const { return last_fetch_; }
    int fetch_count() const { return fetch_count_; }

    // Never fetched, or strictly more than one interval since the last fetch.
    bool due(TimePoint now) const { return !last_fetch_ || now - *last_fetch_ > interval_; }

    void refresh(TimePoint now) {
        fetch();
        last_fetch_ = now;
        ++fetch_count_;
    }

protected:
    virtual void fetch() = 0;

private:
    std::string name_;
    Clock::duration interval_;
    std::optional<TimePoint> last_fetch_;
    int fetch_count_ = 0;
};

// Holds the last fetched value for one data class. Whatever the fetch returns is
// cached, including the empty value a failed request produces.
template <typename T>
class RefreshSlot : public RefreshSlotBase {
public:
    using Fetch = std::function<T()>;

    RefreshSlot(std::string name, Clock::duration interval, Fetch fetch)
        : RefreshSlotBase(std::move(name), interval), fetch_(std::move(fetch)) {}

    const std::optional<T>& cached() const { return cached_; }

protected:
    void fetch() override { cached_ = fetch_(); }

private:
    Fetch fetch_;
    std::optional<T> cached_;
};

class RefreshScheduler {
public:
    template <typename T>
    RefreshSlot<T>& add(std::string name, Clock::duration interval, typename RefreshSlot<T>::Fetch fetch) {
        auto slot = std::make_unique<RefreshSlot<T>>(std::move(name), interval, std::move(fetch));
        RefreshSlot<T>& ref = *slot;
        slots_.push_back(std::move(slot));
        return ref;
    }

    // Fetches every due slot once. Returns how many fetched.
    int tick(TimePoint now);

    size_t size() const { return slots_.size(); }

private:
    std::vector<std::unique_ptr<RefreshSlotBase>> slots_;
};

}  // namespace cutie

#endif  // CUTIE_SCHEDULER_H
