#include <courier/keep_alive_state.hpp>

namespace Courier
{
    namespace
    {
        std::int64_t toTicks(KeepAliveState::Clock::time_point point)
        {
            // +1 keeps a real timestamp distinct from the forced marker
            return std::chrono::duration_cast<std::chrono::milliseconds>(point.time_since_epoch()).count() + 1;
        }
    }

    KeepAliveState::KeepAliveState(std::chrono::milliseconds interval)
        : lastSent_{0}
        , interval_{interval.count()}
    {}

    bool KeepAliveState::due(Clock::time_point now) const
    {
        const auto last = lastSent_.load();
        if (last == 0)
            return true;
        return toTicks(now) - last >= interval_.load();
    }

    void KeepAliveState::markSent(Clock::time_point now)
    {
        lastSent_.store(toTicks(now));
    }

    void KeepAliveState::forceNext()
    {
        lastSent_.store(0);
    }

    std::chrono::milliseconds KeepAliveState::interval() const
    {
        return std::chrono::milliseconds{interval_.load()};
    }

    void KeepAliveState::interval(std::chrono::milliseconds interval)
    {
        interval_.store(interval.count());
    }
}
