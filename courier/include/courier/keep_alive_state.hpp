#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace Courier
{
    /**
     * @brief Last sent timestamp and interval of keep alive pings.
     * Read and written from the keep alive thread and caller threads without a lock, a race costs one extra ping.
     */
    class KeepAliveState
    {
      public:
        using Clock = std::chrono::steady_clock;

        explicit KeepAliveState(std::chrono::milliseconds interval);

        /**
         * @brief True if the next ping must be sent, either because it was forced or because the interval elapsed.
         */
        bool due(Clock::time_point now) const;

        void markSent(Clock::time_point now);

        /**
         * @brief Make the next due() return true.
         */
        void forceNext();

        std::chrono::milliseconds interval() const;
        void interval(std::chrono::milliseconds interval);

      private:
        // 0 means "never sent / forced"
        std::atomic<std::int64_t> lastSent_;
        std::atomic<std::int64_t> interval_;
    };
}
