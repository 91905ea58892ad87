#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace Courier
{
    /**
     * @brief Background loop that pings a connection every interval + 1ms.
     * The loop ends on stop() or on the first failed ping, it never reconnects.
     */
    class KeepAliveScheduler
    {
      public:
        /// Returns false if the connection is presumed lost.
        using PingFunction = std::function<bool()>;
        using FailureFunction = std::function<void()>;

        KeepAliveScheduler(std::chrono::milliseconds interval, PingFunction ping, FailureFunction onFailure);
        ~KeepAliveScheduler();
        KeepAliveScheduler(KeepAliveScheduler const&) = delete;
        KeepAliveScheduler& operator=(KeepAliveScheduler const&) = delete;
        KeepAliveScheduler(KeepAliveScheduler&&) = delete;
        KeepAliveScheduler& operator=(KeepAliveScheduler&&) = delete;

        /**
         * @brief Starts the loop. Does nothing if it was started before.
         */
        void start();

        /**
         * @brief Asks the loop to end and wakes it up without waiting for it.
         * This is the only way to end the loop from inside the ping or failure callback.
         */
        void requestStop();

        /**
         * @brief Requests the loop to stop and joins it. Called from the loop thread itself it only requests.
         */
        void stop();

        /**
         * @brief True if called from the loop thread. Such a caller must not destroy the scheduler.
         */
        bool isLoopThread() const;

        /**
         * @brief True while the loop thread is alive and was not asked to stop.
         */
        bool isRunning() const;

      private:
        void run();

      private:
        std::chrono::milliseconds interval_;
        PingFunction ping_;
        FailureFunction onFailure_;
        mutable std::mutex mutex_;
        std::condition_variable wakeUp_;
        bool stopRequested_;
        bool running_;
        bool started_;
        std::mutex joinMutex_;
        std::thread thread_;
    };
}
