#pragma once

#include <courier/connection.hpp>
#include <courier/error.hpp>
#include <courier/event_sink.hpp>
#include <courier/keep_alive_scheduler.hpp>
#include <courier/keep_alive_state.hpp>
#include <persistence/state/session_options.hpp>
#include <ssh/transport_interface.hpp>

#include <atomic>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Courier
{
    enum class SessionState
    {
        Disconnected,
        Connecting,
        Connected,
        Stale,
        Reconnecting,
    };

    /**
     * @brief Owns the one live connection of a client: connects lazily, detects stale connections and reconnects.
     * All state transitions are serialized by one recursive mutex.
     */
    class TransportSession
    {
      public:
        TransportSession(
            std::shared_ptr<SecureShell::ITransport> transport,
            Persistence::SessionOptions options,
            std::shared_ptr<EventSink> events);
        ~TransportSession();
        TransportSession(TransportSession const&) = delete;
        TransportSession& operator=(TransportSession const&) = delete;
        TransportSession(TransportSession&&) = delete;
        TransportSession& operator=(TransportSession&&) = delete;

        /**
         * @brief Returns the live connection. Connects if there is none, reconnects if the current one is stale
         * (channel closed, session not connected, channel at EOF or a failing keep alive ping).
         *
         * @return std::expected<std::shared_ptr<Connection>, Error> ConnectionError or ConfigurationError on failure.
         */
        std::expected<std::shared_ptr<Connection>, Error> getConnection();

        std::expected<void, Error> connect();

        /**
         * @brief Stops keep alive, closes the channel, then the session. Does nothing when disconnected.
         */
        void disconnect();

        std::expected<void, Error> reconnect();

        /**
         * @brief Sends a keep alive if forced or if the interval elapsed since the last one.
         *
         * @return true The ping was sent or was not due.
         * @return false Any failure, including not being connected.
         */
        bool sendKeepAlive(bool forced);

        /**
         * @brief Logs a transport failure of an operation and forces the next keep alive ping.
         */
        void noteTransportFailure(std::string const& context, SecureShell::SftpError const& cause);

        /**
         * @brief Runs a configuration change under the session lock. StateError if connected.
         */
        template <typename FunctionT>
        std::expected<void, Error> whileDisconnected(FunctionT&& mutation)
        {
            std::scoped_lock lock{mutex_};
            if (connection_)
            {
                return std::unexpected(Error{
                    .type = ErrorType::StateError,
                    .message = "There is already an active sftp connection",
                });
            }
            std::forward<FunctionT>(mutation)(options_);
            keepAlive_.interval(options_.keepAliveInterval());
            keepAlive_.forceNext();
            return {};
        }

        /**
         * @brief Runs a configuration change that does not affect the connection.
         */
        template <typename FunctionT>
        void updateOptions(FunctionT&& mutation)
        {
            std::scoped_lock lock{mutex_};
            std::forward<FunctionT>(mutation)(options_);
        }

        Persistence::SessionOptions options() const;

        bool isConnected() const;
        SessionState state() const;
        KeepAliveState const& keepAliveState() const
        {
            return keepAlive_;
        }
        bool keepAliveRunning() const;

        /**
         * @brief user@host:port
         */
        std::string endpoint() const;

      private:
        std::expected<void, Error> connectLocked();
        void disconnectLocked();
        void retireScheduler();
        void joinRetiredSchedulers();
        std::expected<std::shared_ptr<Connection>, Error> acquireConnection();
        std::optional<std::string> staleReason(Connection& connection);
        std::expected<std::shared_ptr<Connection>, Error> openConnection();

      private:
        mutable std::recursive_mutex mutex_;
        std::shared_ptr<SecureShell::ITransport> transport_;
        Persistence::SessionOptions options_;
        std::shared_ptr<EventSink> events_;
        std::shared_ptr<Connection> connection_;
        std::unique_ptr<KeepAliveScheduler> scheduler_;
        /// Stopped schedulers whose threads still have to be joined outside of the lock.
        std::vector<std::unique_ptr<KeepAliveScheduler>> retiredSchedulers_;
        KeepAliveState keepAlive_;
        std::atomic<SessionState> state_;
    };
}
