#pragma once

#include <courier/transfer_state.hpp>
#include <persistence/state/transfer_options.hpp>

#include <string>

namespace Courier
{
    /**
     * @brief Receives structured events of a client. Implementations must be thread safe,
     * events are emitted from caller threads and from the keep alive thread.
     */
    class EventSink
    {
      public:
        virtual ~EventSink() = default;

        virtual void onConnectAttempt(std::string const& endpoint) = 0;
        virtual void onConnected(std::string const& endpoint) = 0;
        virtual void onDisconnected(std::string const& endpoint) = 0;
        virtual void onReconnect(std::string const& endpoint, std::string const& reason) = 0;
        virtual void onKeepAliveFailure(std::string const& endpoint) = 0;
        virtual void onConflictResolved(
            std::string const& requested,
            std::string const& resolved,
            Persistence::OverwritePolicy policy) = 0;
        virtual void onTransferState(std::string const& target, TransferState state) = 0;
    };

    /**
     * @brief Default sink, forwards everything to the Log facade.
     */
    class LoggingEventSink : public EventSink
    {
      public:
        void onConnectAttempt(std::string const& endpoint) override;
        void onConnected(std::string const& endpoint) override;
        void onDisconnected(std::string const& endpoint) override;
        void onReconnect(std::string const& endpoint, std::string const& reason) override;
        void onKeepAliveFailure(std::string const& endpoint) override;
        void onConflictResolved(
            std::string const& requested,
            std::string const& resolved,
            Persistence::OverwritePolicy policy) override;
        void onTransferState(std::string const& target, TransferState state) override;
    };
}
