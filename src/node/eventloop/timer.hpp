#pragma once
#include "batch/ids.hpp"
#include <chrono>
#include <map>
#include <optional>
#include <variant>
#include <vector>

namespace eventloop {
namespace timer_events {
    // reprocess a batch whose processing hit a transient error
    struct RetryBatch {
        BatchId batchId;
        uint32_t attempt;
    };
    using Event = std::variant<RetryBatch>;
}

class Timer;
class TimerSystem {
public:
    using clock = std::chrono::steady_clock;
    using time_point = clock::time_point;
    TimerSystem() {};
    TimerSystem(const TimerSystem&) = delete;

    using Event = timer_events::Event;

public:
    struct key_t {
        time_point wakeup_tp;
        int i;
        auto operator<=>(const key_t&) const = default;
    };
    using Ordered = std::map<key_t, Event>;
    // Methods

    bool erase(const Timer&);
    bool erase(const std::optional<Timer>& o);
    bool erase(key_t k)
    {
        return ordered.erase(k) != 0;
    }

    Timer insert(time_point expires, Event e);
    Timer insert(time_point now, clock::duration duration, Event e);
    std::vector<Event> pop_expired(time_point now);
    std::optional<time_point> next() const;
    size_t size() const { return ordered.size(); }

private:
    Ordered ordered;
    int keyExtra { 0 };
};

class Timer {
    friend class TimerSystem;
    Timer(TimerSystem::key_t k)
        : _key(k)
    {
    }

public:
    TimerSystem::key_t key() const
    {
        return _key;
    }
    auto wakeup_tp() const
    {
        return _key.wakeup_tp;
    }

protected:
    TimerSystem::key_t _key;
};

inline Timer TimerSystem::insert(time_point now, clock::duration duration, Event e)
{
    return insert(now + duration, std::move(e));
}

inline Timer TimerSystem::insert(time_point expires, Event e)
{
    key_t key { expires, keyExtra++ };
    ordered.emplace(key, std::move(e));
    return { key };
}

inline bool TimerSystem::erase(const Timer& t)
{
    return ordered.erase(t.key());
}
inline bool TimerSystem::erase(const std::optional<Timer>& o)
{
    return o && erase(*o);
}

}
