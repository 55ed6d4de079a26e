#include "timer.hpp"

namespace eventloop {
std::vector<TimerSystem::Event> TimerSystem::pop_expired(time_point now)
{
    std::vector<TimerSystem::Event> res;
    for (auto iter = ordered.begin(); iter != ordered.end();) {
        if (iter->first.wakeup_tp > now)
            break;
        res.push_back(std::move(iter->second));
        ordered.erase(iter++);
    }
    return res;
}

std::optional<TimerSystem::time_point> TimerSystem::next() const
{
    if (ordered.empty())
        return {};
    return ordered.begin()->first.wakeup_tp;
};
}
