#include <courier/keep_alive_scheduler.hpp>
#include <log/log.hpp>

namespace Courier
{
    KeepAliveScheduler::KeepAliveScheduler(
        std::chrono::milliseconds interval,
        PingFunction ping,
        FailureFunction onFailure)
        : interval_{interval}
        , ping_{std::move(ping)}
        , onFailure_{std::move(onFailure)}
        , mutex_{}
        , wakeUp_{}
        , stopRequested_{false}
        , running_{false}
        , started_{false}
        , joinMutex_{}
        , thread_{}
    {}

    KeepAliveScheduler::~KeepAliveScheduler()
    {
        stop();
    }

    void KeepAliveScheduler::start()
    {
        std::scoped_lock lock{mutex_};
        if (started_)
            return;
        started_ = true;
        running_ = true;
        Log::debug("Starting keep alive thread with interval {}ms", interval_.count());
        thread_ = std::thread{[this]() {
            run();
        }};
    }

    void KeepAliveScheduler::requestStop()
    {
        {
            std::scoped_lock lock{mutex_};
            stopRequested_ = true;
        }
        wakeUp_.notify_all();
    }

    void KeepAliveScheduler::stop()
    {
        requestStop();

        std::scoped_lock joinLock{joinMutex_};
        if (thread_.joinable() && !isLoopThread())
        {
            Log::debug("Stopping keep alive thread");
            thread_.join();
        }
    }

    bool KeepAliveScheduler::isLoopThread() const
    {
        return thread_.get_id() == std::this_thread::get_id();
    }

    bool KeepAliveScheduler::isRunning() const
    {
        std::scoped_lock lock{mutex_};
        return running_ && !stopRequested_;
    }

    void KeepAliveScheduler::run()
    {
        const auto sleepTime = interval_ + std::chrono::milliseconds{1};
        while (true)
        {
            {
                std::unique_lock lock{mutex_};
                if (wakeUp_.wait_for(lock, sleepTime, [this]() {
                        return stopRequested_;
                    }))
                    break;
            }

            if (!ping_())
            {
                // a ping racing a disconnect fails on the closed connection
                if (std::scoped_lock lock{mutex_}; stopRequested_)
                    break;
                if (onFailure_)
                    onFailure_();
                break;
            }
        }

        std::scoped_lock lock{mutex_};
        running_ = false;
    }
}
