#pragma once

#include <courier/event_sink.hpp>

#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace Test
{
    class RecordingEventSink : public Courier::EventSink
    {
      public:
        void onConnectAttempt(std::string const& endpoint) override
        {
            record("connectAttempt " + endpoint);
        }
        void onConnected(std::string const& endpoint) override
        {
            record("connected " + endpoint);
        }
        void onDisconnected(std::string const& endpoint) override
        {
            record("disconnected " + endpoint);
        }
        void onReconnect(std::string const& endpoint, std::string const& reason) override
        {
            record("reconnect " + endpoint + " " + reason);
        }
        void onKeepAliveFailure(std::string const& endpoint) override
        {
            record("keepAliveFailure " + endpoint);
            if (keepAliveFailureHandler)
                keepAliveFailureHandler();
        }
        void onConflictResolved(
            std::string const& requested,
            std::string const& resolved,
            Persistence::OverwritePolicy) override
        {
            std::scoped_lock lock{mutex_};
            resolutions_.emplace_back(requested, resolved);
        }
        void onTransferState(std::string const& target, Courier::TransferState state) override
        {
            std::scoped_lock lock{mutex_};
            transferStates_.emplace_back(target, state);
        }

        std::vector<std::string> events() const
        {
            std::scoped_lock lock{mutex_};
            return events_;
        }

        int count(std::string const& prefix) const
        {
            std::scoped_lock lock{mutex_};
            int result = 0;
            for (auto const& event : events_)
                result += event.starts_with(prefix) ? 1 : 0;
            return result;
        }

        std::vector<std::pair<std::string, std::string>> resolutions() const
        {
            std::scoped_lock lock{mutex_};
            return resolutions_;
        }

        std::vector<Courier::TransferState> statesOf(std::string const& target) const
        {
            std::scoped_lock lock{mutex_};
            std::vector<Courier::TransferState> states{};
            for (auto const& [name, state] : transferStates_)
            {
                if (name == target)
                    states.push_back(state);
            }
            return states;
        }

        /// Runs on the thread that reported the failure.
        std::function<void()> keepAliveFailureHandler{};

      private:
        void record(std::string event)
        {
            std::scoped_lock lock{mutex_};
            events_.push_back(std::move(event));
        }

      private:
        mutable std::mutex mutex_{};
        std::vector<std::string> events_{};
        std::vector<std::pair<std::string, std::string>> resolutions_{};
        std::vector<std::pair<std::string, Courier::TransferState>> transferStates_{};
    };
}
